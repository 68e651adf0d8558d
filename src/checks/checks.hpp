#pragma once
#include "base_check.hpp"
#include "config.hpp"
#include <string>
#include <vector>

// Lowercase extensions of the uploaded name and of its sanitized storage
// name, without duplicates.
std::vector<std::string> candidateExtensions(const std::string& originalName);

// Content type sniffed from magic bytes must agree with the extension.
class SignatureCheck : public BaseCheck {
public:
    explicit SignatureCheck(bool enabled = true) : enabled(enabled) {}
    std::string name() const override { return "signature"; }
    void check(const FileDescriptor& file, ScanErrors& errors) const override;

private:
    bool enabled;
};

class ExtensionCheck : public BaseCheck {
public:
    std::string name() const override { return "dangerous-extension"; }
    void check(const FileDescriptor& file, ScanErrors& errors) const override;

    static bool isDangerous(const std::string& extension);
};

class ContentCheck : public BaseCheck {
public:
    explicit ContentCheck(size_t scanWindow = UPLOADGUARD_DEFAULT_CONTENT_WINDOW)
        : scanWindow(scanWindow) {}
    std::string name() const override { return "executable-content"; }
    void check(const FileDescriptor& file, ScanErrors& errors) const override;

private:
    size_t scanWindow;
};

class SizeCheck : public BaseCheck {
public:
    explicit SizeCheck(const SecurityConfig& config) : config(config) {}
    std::string name() const override { return "size-bomb"; }
    void check(const FileDescriptor& file, ScanErrors& errors) const override;

private:
    void checkExpansion(const FileDescriptor& file, ScanErrors& errors) const;

    SecurityConfig config;
};
