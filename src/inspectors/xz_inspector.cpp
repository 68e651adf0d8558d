#include "base_inspector.hpp"
#include "inspector_registration.hpp"
#include <string>
#include <vector>
#include "logger.hpp"
#include <lzma.h>  // Requires liblzma (xz-utils)

class XZInspector : public BaseInspector {
public:
    std::string name() const override { return "XZ"; }
    std::string mimeType() const override { return "application/x-xz"; }

    InspectionResult inspect(const std::vector<std::uint8_t>& blob, uint64_t limit) override {
        InspectionResult result;

        lzma_stream strm = LZMA_STREAM_INIT;
        // Decoder memory is capped too; a crafted header can ask for gigabytes.
        lzma_ret ret = lzma_stream_decoder(&strm, DECODER_MEMLIMIT, LZMA_CONCATENATED);
        if (ret != LZMA_OK) {
            Logger::error("XZ failed to init decoder");
            result.info = "decoder init failed";
            return result;
        }

        strm.next_in = blob.data();
        strm.avail_in = blob.size();

        std::vector<uint8_t> buf(1 << 16); // 64 KiB buffer

        while (true) {
            strm.next_out = buf.data();
            strm.avail_out = buf.size();

            ret = lzma_code(&strm, LZMA_FINISH);
            result.expandedBytes += buf.size() - strm.avail_out;

            if (result.expandedBytes > limit) {
                result.limitExceeded = true;
                break;
            }
            if (ret == LZMA_STREAM_END) {
                result.readable = true;
                result.entries = 1;
                break;
            }
            if (ret != LZMA_OK) {
                result.info = describe(ret);
                Logger::debug("XZ inspection failed: " + result.info);
                break;
            }
        }

        lzma_end(&strm);

        if (result.limitExceeded) {
            result.readable = true;
            result.info = "expansion stopped at limit";
        } else if (result.readable) {
            result.info = "xz stream";
        }
        return result;
    }

private:
    static constexpr uint64_t DECODER_MEMLIMIT = 256ULL * 1024 * 1024;

    static std::string describe(lzma_ret ret) {
        switch (ret) {
            case LZMA_MEMLIMIT_ERROR: return "decoder memory limit reached";
            case LZMA_FORMAT_ERROR:   return "not an xz stream";
            case LZMA_DATA_ERROR:     return "corrupt xz data";
            case LZMA_BUF_ERROR:      return "truncated xz stream";
            default:                  return "xz error " + std::to_string(static_cast<int>(ret));
        }
    }
};

REGISTER_INSPECTOR(XZInspector)
