#include "base_inspector.hpp"
#include "inspector_registration.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include "logger.hpp"

class GZIPInspector : public BaseInspector {
public:
    std::string name() const override { return "GZIP"; }
    std::string mimeType() const override { return "application/gzip"; }

    InspectionResult inspect(const std::vector<std::uint8_t>& blob, uint64_t limit) override
    {
        InspectionResult result;

        z_stream strm{};
        // 16+MAX_WBITS tells zlib to expect GZIP header
        if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
            Logger::error("GZIP inflateInit2 failed");
            result.info = "inflateInit2 failed";
            return result;
        }

        const size_t CHUNK = 16384;
        std::vector<uint8_t> buffer(CHUNK);
        size_t consumed = 0;
        std::string failure = "truncated gzip stream";

        // Concatenated members are legal gzip, keep going until input runs out.
        while (consumed < blob.size()) {
            strm.next_in = const_cast<Bytef*>(blob.data() + consumed);
            strm.avail_in = static_cast<uInt>(std::min<size_t>(blob.size() - consumed, UINT32_MAX));
            const uInt offered = strm.avail_in;

            int ret = Z_OK;
            while (true) {
                strm.next_out = buffer.data();
                strm.avail_out = static_cast<uInt>(buffer.size());

                ret = inflate(&strm, Z_NO_FLUSH);
                if (ret != Z_OK && ret != Z_STREAM_END) {
                    break;
                }
                result.expandedBytes += buffer.size() - strm.avail_out;
                if (result.expandedBytes > limit) {
                    result.limitExceeded = true;
                    break;
                }
                if (ret == Z_STREAM_END) break;
                if (strm.avail_in == 0 && strm.avail_out != 0) break;
            }
            consumed += offered - strm.avail_in;

            if (result.limitExceeded) {
                break;
            }
            if (ret == Z_STREAM_END) {
                ++result.entries;
                if (inflateReset(&strm) != Z_OK) break;
                continue;
            }
            if (ret == Z_OK && consumed < blob.size()) {
                continue;
            }
            if (strm.msg) {
                failure = strm.msg;
            }
            break;
        }
        inflateEnd(&strm);

        if (result.limitExceeded) {
            result.readable = true;
            result.info = "expansion stopped at limit";
        } else if (result.entries > 0) {
            // trailing garbage after a complete member is tolerated
            result.readable = true;
            result.info = std::to_string(result.entries) + " member(s)";
        } else {
            result.info = failure;
            Logger::debug("GZIP inspection failed: " + failure);
        }
        return result;
    }
};

REGISTER_INSPECTOR(GZIPInspector)
