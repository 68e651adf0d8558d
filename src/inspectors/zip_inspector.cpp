#include "base_inspector.hpp"
#include "inspector_registration.hpp"
#include <zip.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include "logger.hpp"

// Expanded size is the larger of two measures: the uncompressed sizes the
// central directory records, and the bytes each entry actually inflates to.
// Recorded sizes catch overlapping-entry bombs cheaply; inflating catches
// entries whose recorded size is a lie. Inflation stops once the limit is
// passed.
class ZIPInspector : public BaseInspector {
public:
    std::string name() const override { return "ZIP"; }
    std::string mimeType() const override { return "application/zip"; }

    InspectionResult inspect(const std::vector<uint8_t>& blob, uint64_t limit) override {
        InspectionResult result;

        zip_error_t error;
        zip_error_init(&error);

        zip_source_t* src = zip_source_buffer_create(blob.data(), blob.size(), 0, &error);
        if (!src) {
            result.info = std::string("cannot create zip source: ") + zip_error_strerror(&error);
            Logger::error("ZIPInspector: " + result.info);
            zip_error_fini(&error);
            return result;
        }

        zip_t* archive = zip_open_from_source(src, ZIP_RDONLY, &error);
        if (!archive) {
            result.info = std::string("cannot open zip archive: ") + zip_error_strerror(&error);
            Logger::debug("ZIPInspector: " + result.info);
            zip_source_free(src);
            zip_error_fini(&error);
            return result;
        }

        uint64_t recorded = 0;
        uint64_t inflated = 0;
        std::vector<uint8_t> buffer(64 * 1024);

        zip_int64_t num_entries = zip_get_num_entries(archive, 0);
        for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(num_entries); ++i) {
            zip_stat_t st;
            zip_stat_init(&st);
            if (zip_stat_index(archive, i, 0, &st) != 0) {
                continue;
            }
            ++result.entries;
            if (st.valid & ZIP_STAT_SIZE) {
                recorded += st.size;
            }
            if (recorded > limit) {
                result.limitExceeded = true;
                break;
            }

            inflated += inflateEntry(archive, i, buffer, limit - inflated);
            if (inflated > limit) {
                result.limitExceeded = true;
                break;
            }
        }
        result.expandedBytes = std::max(recorded, inflated);

        zip_discard(archive);
        zip_error_fini(&error);

        result.readable = true;
        result.info = "ZIP archive, entries=" + std::to_string(result.entries);
        return result;
    }

private:
    // Bytes the entry inflates to, reading one byte past `remaining` at most
    // so the caller can tell it was exceeded. Entries libzip
    // cannot open (encrypted, unsupported method) count as zero here and are
    // covered by their recorded size only.
    static uint64_t inflateEntry(zip_t* archive, zip_uint64_t index,
                                 std::vector<uint8_t>& buffer, uint64_t remaining) {
        zip_file_t* zf = zip_fopen_index(archive, index, 0);
        if (!zf) {
            Logger::debug("ZIPInspector: cannot open entry " + std::to_string(index) +
                          ": " + zip_strerror(archive));
            return 0;
        }

        uint64_t total = 0;
        while (total <= remaining) {
            const uint64_t left = remaining - total;
            const zip_uint64_t want = left >= buffer.size() ? buffer.size() : left + 1;
            zip_int64_t n = zip_fread(zf, buffer.data(), want);
            if (n < 0) {
                Logger::debug("ZIPInspector: read error in entry " + std::to_string(index) +
                              ": " + zip_file_strerror(zf));
                break;
            }
            if (n == 0) {
                break;
            }
            total += static_cast<uint64_t>(n);
        }
        zip_fclose(zf);
        return total;
    }
};

REGISTER_INSPECTOR(ZIPInspector)
