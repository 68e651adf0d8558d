#include "scanner.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace {

// Scripted adapter; counts how often the scanner reaches it.
class FakeAdapter : public ScannerAdapter {
public:
    enum class Mode { Clean, Infected, Unreachable, Crashing };

    FakeAdapter(Mode mode, std::shared_ptr<std::atomic<int>> calls)
        : mode(mode), calls(std::move(calls)) {}

    std::string name() const override { return "fake"; }

    ScanVerdict scan(const FileDescriptor&, const CancelToken& cancel) override
    {
        ++*calls;
        if (cancel.isCancelled()) {
            throw ExternalScannerError("cancelled");
        }
        ScanVerdict verdict;
        switch (mode) {
            case Mode::Clean:
                break;
            case Mode::Infected:
                verdict.infected = true;
                verdict.threat = "Eicar-Test-Signature";
                break;
            case Mode::Unreachable:
                throw ExternalScannerError("connection refused");
            case Mode::Crashing:
                throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                        "worker thread");
        }
        return verdict;
    }

private:
    Mode mode;
    std::shared_ptr<std::atomic<int>> calls;
};

std::vector<ScanError> scan_errors(const Scanner& scanner, const FileDescriptor& file)
{
    try {
        scanner.scan(file);
    } catch (const SecurityError& e) {
        EXPECT_STREQ(e.what(), "File security scan failed");
        return e.errors();
    }
    return {};
}

bool contains(const std::vector<ScanError>& errors, const std::string& needle)
{
    return std::any_of(errors.begin(), errors.end(),
                       [&](const ScanError& e) { return e.find(needle) != std::string::npos; });
}

TEST(Scanner, CleanJpegPasses)
{
    Scanner scanner;
    EXPECT_TRUE(scanner.scan(make_file("photo.jpg", jpeg_bytes(), 1024, "image/jpeg")));
}

TEST(Scanner, ExecutableWithExeExtensionCollectsEveryProblem)
{
    Scanner scanner;
    const auto errors = scan_errors(scanner, make_file("malware.exe", bytes({ 0x4D, 0x5A })));
    ASSERT_GE(errors.size(), 2u);
    EXPECT_TRUE(contains(errors, "Dangerous file extension detected: .exe"));
    EXPECT_TRUE(contains(errors, "Windows executable"));
}

TEST(Scanner, JpegNamedPngFailsOnlyOnSignature)
{
    Scanner scanner;
    const auto errors = scan_errors(scanner, make_file("fake.png", jpeg_bytes(), 1024, "image/png"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(contains(errors, "signature mismatch"));
}

TEST(Scanner, DangerousExtensionRejectsRegardlessOfContent)
{
    Scanner scanner;
    for (const char* name : { "SHELL.PHP", "install.sh", "page.html", "evil.SvG" }) {
        EXPECT_THROW(scanner.scan(make_file(name, png_bytes())), SecurityError) << name;
    }
}

TEST(Scanner, ExecutableDisguisedAsImageIsRejected)
{
    Scanner scanner;
    const auto elf = scan_errors(
        scanner, make_file("cat.jpg", padded(bytes({ 0x7F, 0x45, 0x4C, 0x46, 0x02, 0x01, 0x01 })),
                           1024, "image/jpeg"));
    EXPECT_TRUE(contains(elf, "Linux executable"));

    const auto pe = scan_errors(scanner, make_file("cat.png", bytes({ 0x4D, 0x5A, 0x90 }),
                                                   1024, "image/png"));
    EXPECT_TRUE(contains(pe, "Windows executable"));
}

TEST(Scanner, SizeLimitBoundary)
{
    SecurityConfig config;
    config.maxSizeBytes = 2048;
    Scanner scanner(config);

    EXPECT_TRUE(scanner.scan(make_file("photo.jpg", jpeg_bytes(), 2048)));
    const auto errors = scan_errors(scanner, make_file("photo.jpg", jpeg_bytes(), 2049));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(contains(errors, "exceeds security limit"));
}

TEST(Scanner, ErrorsFollowCheckOrder)
{
    SecurityConfig config;
    config.maxSizeBytes = 10;
    Scanner scanner(config);

    // jpeg bytes, .php name, script in the body, oversized
    std::vector<uint8_t> content = jpeg_bytes();
    const std::string script = "<script>";
    content.insert(content.end(), script.begin(), script.end());
    const auto errors = scan_errors(scanner, make_file("shell.php", content, 4096));

    ASSERT_EQ(errors.size(), 3u);
    EXPECT_TRUE(contains({ errors[0] }, "Dangerous file extension"));
    EXPECT_TRUE(contains({ errors[1] }, "<script>"));
    EXPECT_TRUE(contains({ errors[2] }, "exceeds security limit"));
}

TEST(Scanner, SignatureValidationCanBeSwitchedOff)
{
    SecurityConfig config;
    config.validateSignatures = false;
    Scanner scanner(config);
    EXPECT_TRUE(scanner.scan(make_file("fake.png", jpeg_bytes())));
}

TEST(Scanner, DoesNotModifyTheDescriptor)
{
    Scanner scanner;
    const FileDescriptor file = make_file("malware.exe", bytes({ 0x4D, 0x5A }), 77, "image/png");
    const FileDescriptor copy = file;
    EXPECT_THROW(scanner.scan(file), SecurityError);
    EXPECT_EQ(file.originalName, copy.originalName);
    EXPECT_EQ(file.declaredMimeType, copy.declaredMimeType);
    EXPECT_EQ(file.sizeBytes, copy.sizeBytes);
    EXPECT_EQ(file.content, copy.content);
}

// --- custom scanner --------------------------------------------------------

TEST(ScannerCustomAdapter, CleanVerdictPassesAndRunsOnce)
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    Scanner scanner(SecurityConfig{}, std::make_unique<FakeAdapter>(FakeAdapter::Mode::Clean, calls));
    EXPECT_TRUE(scanner.hasCustomScanner());
    EXPECT_TRUE(scanner.scan(make_file("photo.jpg", jpeg_bytes())));
    EXPECT_EQ(calls->load(), 1);
}

TEST(ScannerCustomAdapter, InfectionRejects)
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    Scanner scanner(SecurityConfig{}, std::make_unique<FakeAdapter>(FakeAdapter::Mode::Infected, calls));
    const auto errors = scan_errors(scanner, make_file("photo.jpg", jpeg_bytes()));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Virus detected: Eicar-Test-Signature");
    EXPECT_EQ(calls->load(), 1);
}

TEST(ScannerCustomAdapter, FailureIsNeverAPass)
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    Scanner scanner(SecurityConfig{}, std::make_unique<FakeAdapter>(FakeAdapter::Mode::Unreachable, calls));
    const auto errors = scan_errors(scanner, make_file("photo.jpg", jpeg_bytes()));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(contains(errors, "Custom scanner failed: connection refused"));
}

TEST(ScannerCustomAdapter, UnexpectedAdapterExceptionIsARejection)
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    Scanner scanner(SecurityConfig{}, std::make_unique<FakeAdapter>(FakeAdapter::Mode::Crashing, calls));
    const auto errors = scan_errors(scanner, make_file("photo.jpg", jpeg_bytes()));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(contains(errors, "Custom scanner failed: worker thread"));
    EXPECT_EQ(calls->load(), 1);
}

TEST(ScannerCustomAdapter, LocalErrorsTravelWithTheVerdict)
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    Scanner scanner(SecurityConfig{}, std::make_unique<FakeAdapter>(FakeAdapter::Mode::Infected, calls));
    const auto errors = scan_errors(scanner, make_file("fake.png", jpeg_bytes()));
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_TRUE(contains({ errors[0] }, "signature mismatch"));
    EXPECT_TRUE(contains({ errors[1] }, "Virus detected"));
    EXPECT_EQ(calls->load(), 1);
}

TEST(ScannerCustomAdapter, UnknownTypeIsAConfigError)
{
    SecurityConfig config;
    config.customScanner = CustomScannerConfig{};
    config.customScanner->type = "no-such-scanner";
    EXPECT_THROW(Scanner{ config }.hasCustomScanner(), ConfigError);
}

TEST(ScannerCustomAdapter, NoneTypeIsAlwaysClean)
{
    SecurityConfig config;
    config.customScanner = CustomScannerConfig{};
    config.customScanner->type = "none";
    Scanner scanner(config);
    EXPECT_TRUE(scanner.hasCustomScanner());
    EXPECT_TRUE(scanner.scan(make_file("photo.jpg", jpeg_bytes())));
}

// --- async -----------------------------------------------------------------

TEST(ScannerAsync, ResolvesAndRejectsThroughTheFuture)
{
    Scanner scanner;
    auto ok = scanner.scanAsync(make_file("photo.jpg", jpeg_bytes()));
    auto bad = scanner.scanAsync(make_file("malware.exe", bytes({ 0x4D, 0x5A })));
    EXPECT_TRUE(ok.get());
    EXPECT_THROW(bad.get(), SecurityError);
}

TEST(ScannerAsync, CancelledScanIsRejected)
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    Scanner scanner(SecurityConfig{}, std::make_unique<FakeAdapter>(FakeAdapter::Mode::Clean, calls));
    auto cancel = std::make_shared<CancelToken>();
    cancel->cancel();
    auto result = scanner.scanAsync(make_file("photo.jpg", jpeg_bytes()), cancel);
    EXPECT_THROW(result.get(), SecurityError);
}

TEST(ScannerAsync, ConcurrentScansShareOneScanner)
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    Scanner scanner(SecurityConfig{}, std::make_unique<FakeAdapter>(FakeAdapter::Mode::Clean, calls));

    std::vector<std::future<bool>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(scanner.scanAsync(make_file("photo" + std::to_string(i) + ".jpg", jpeg_bytes())));
    }
    for (auto& f : futures) {
        EXPECT_TRUE(f.get());
    }
    EXPECT_EQ(calls->load(), 16);
}

}  // namespace
