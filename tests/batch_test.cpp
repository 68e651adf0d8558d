#include "batch.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Concurrency {
    std::atomic<int> current{0};
    std::atomic<int> peak{0};
};

// Clean verdict after a short delay; records how many scans overlap.
class SlowAdapter : public ScannerAdapter {
public:
    explicit SlowAdapter(std::shared_ptr<Concurrency> stats) : stats(std::move(stats)) {}

    std::string name() const override { return "slow"; }

    ScanVerdict scan(const FileDescriptor&, const CancelToken&) override
    {
        const int now = ++stats->current;
        int peak = stats->peak.load();
        while (now > peak && !stats->peak.compare_exchange_weak(peak, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --stats->current;
        return {};
    }

private:
    std::shared_ptr<Concurrency> stats;
};

std::string write_temp(const std::string& name, const std::vector<uint8_t>& content)
{
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(content.data()),
              static_cast<std::streamsize>(content.size()));
    return path;
}

TEST(ScanFiles, ReportsFollowInputOrder)
{
    Scanner scanner;
    const std::vector<std::string> paths = {
        write_temp("batch_photo.jpg", jpeg_bytes()),
        write_temp("batch_tool.exe", bytes({ 0x4D, 0x5A, 0x90, 0x00 })),
        write_temp("batch_image.png", png_bytes()),
    };

    const auto reports = scanFiles(scanner, paths, "application/octet-stream", 2);
    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(reports[0].path, paths[0]);
    EXPECT_TRUE(reports[0].passed);
    EXPECT_EQ(reports[0].detectedType, "image/jpeg");
    EXPECT_EQ(reports[0].storageName, "batch_photo.jpg");

    EXPECT_FALSE(reports[1].passed);
    EXPECT_GE(reports[1].errors.size(), 2u);
    EXPECT_EQ(reports[1].size, 4u);

    EXPECT_TRUE(reports[2].passed);

    for (const auto& path : paths) {
        std::remove(path.c_str());
    }
}

TEST(ScanFiles, InFlightScansAreBounded)
{
    auto stats = std::make_shared<Concurrency>();
    Scanner scanner(SecurityConfig{}, std::make_unique<SlowAdapter>(stats));

    std::vector<std::string> paths;
    for (int i = 0; i < 12; ++i) {
        paths.push_back(write_temp("batch_bounded_" + std::to_string(i) + ".jpg", jpeg_bytes()));
    }

    const auto reports = scanFiles(scanner, paths, "image/jpeg", 3);
    ASSERT_EQ(reports.size(), paths.size());
    EXPECT_TRUE(std::all_of(reports.begin(), reports.end(),
                            [](const ScanReport& r) { return r.passed; }));
    EXPECT_LE(stats->peak.load(), 3);
    EXPECT_GE(stats->peak.load(), 1);

    for (const auto& path : paths) {
        std::remove(path.c_str());
    }
}

TEST(ScanFiles, UnreadableFileThrows)
{
    Scanner scanner;
    EXPECT_THROW(scanFiles(scanner, { "/nonexistent/upload.bin" }, "application/octet-stream", 4),
                 std::runtime_error);
}

TEST(ScanFiles, DefaultParallelismIsAtLeastTwo)
{
    EXPECT_GE(default_parallel_scans(), 2u);
}

}  // namespace
