#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <vector>

inline const std::string UNKNOWN_FILE_TYPE = "unknown";

// Bytes that must appear at a fixed offset.
struct MagicBytes {
    size_t offset;
    std::vector<uint8_t> bytes;
};

// Formats with several signatures (ZIP, MP3, ...) get one rule per
// signature, all sharing the MIME type and extension set.
struct SignatureRule {
    std::string mimeType;
    std::set<std::string> extensions;
    std::vector<MagicBytes> magicBytes;

    bool matches(const std::vector<uint8_t>& buffer) const;
    bool accepts(const std::string& extension) const;
};

// Ordered, first match wins. Built on first use and never modified.
const std::vector<SignatureRule>& signatureRules();

// Minimum prefix inspected; shorter buffers are "unknown".
constexpr size_t DETECTION_PREFIX_BYTES = 12;

std::string detectFileType(const std::vector<uint8_t>& buffer);

const SignatureRule* findSignatureRule(const std::string& mimeType);
const SignatureRule* findRuleForExtension(const std::string& extension);
