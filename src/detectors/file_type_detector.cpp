#include "file_type_detector.hpp"
#include "helpers.hpp"
#include "logger.hpp"

namespace {

std::vector<SignatureRule> buildRules() {
    const std::set<std::string> jpeg = {".jpg", ".jpeg", ".jpe", ".jfif"};
    const std::set<std::string> zip = {".zip", ".docx", ".xlsx", ".pptx",
                                       ".odt", ".ods", ".odp", ".epub"};
    const std::set<std::string> mpeg = {".mpeg", ".mpg"};
    const std::set<std::string> mp4 = {".mp4", ".m4v", ".m4a", ".mov", ".3gp"};
    const std::set<std::string> mp3 = {".mp3"};

    // Order matters: MPEG audio frame sync and JPEG both start with FF, and
    // the ftyp box is only looked for once nothing anchored at 0 matched.
    return {
        {"image/jpeg", jpeg, {{0, {0xFF, 0xD8, 0xFF}}}},
        {"image/png", {".png"}, {{0, {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}}}},
        {"image/gif", {".gif"}, {{0, {0x47, 0x49, 0x46, 0x38}}}},
        {"image/webp", {".webp"}, {{0, {'R', 'I', 'F', 'F'}}, {8, {'W', 'E', 'B', 'P'}}}},
        {"application/pdf", {".pdf"}, {{0, {0x25, 0x50, 0x44, 0x46}}}},
        {"application/zip", zip, {{0, {0x50, 0x4B, 0x03, 0x04}}}},
        {"application/zip", zip, {{0, {0x50, 0x4B, 0x05, 0x06}}}},
        {"application/zip", zip, {{0, {0x50, 0x4B, 0x07, 0x08}}}},
        {"application/gzip", {".gz", ".tgz"}, {{0, {0x1F, 0x8B, 0x08}}}},
        {"application/x-xz", {".xz", ".txz"}, {{0, {0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00}}}},
        {"video/mpeg", mpeg, {{0, {0x00, 0x00, 0x01, 0xBA}}}},
        {"video/mpeg", mpeg, {{0, {0x00, 0x00, 0x01, 0xB3}}}},
        {"video/mp4", mp4, {{4, {'f', 't', 'y', 'p'}}}},
        {"audio/mpeg", mp3, {{0, {0x49, 0x44, 0x33}}}},
        {"audio/mpeg", mp3, {{0, {0xFF, 0xFB}}}},
        {"audio/mpeg", mp3, {{0, {0xFF, 0xF3}}}},
        {"audio/mpeg", mp3, {{0, {0xFF, 0xF2}}}},
    };
}

} // namespace

bool SignatureRule::matches(const std::vector<uint8_t>& buffer) const {
    for (const auto& magic : magicBytes) {
        if (!bytes_at(buffer, magic.offset, magic.bytes)) {
            return false;
        }
    }
    return !magicBytes.empty();
}

bool SignatureRule::accepts(const std::string& extension) const {
    return extensions.count(extension) > 0;
}

const std::vector<SignatureRule>& signatureRules() {
    static const std::vector<SignatureRule> rules = buildRules();
    return rules;
}

std::string detectFileType(const std::vector<uint8_t>& buffer) {
    if (buffer.size() < DETECTION_PREFIX_BYTES) {
        return UNKNOWN_FILE_TYPE;
    }
    for (const auto& rule : signatureRules()) {
        if (rule.matches(buffer)) {
            return rule.mimeType;
        }
    }
    Logger::debug("No signature for header " + hex_prefix(buffer, DETECTION_PREFIX_BYTES));
    return UNKNOWN_FILE_TYPE;
}

const SignatureRule* findSignatureRule(const std::string& mimeType) {
    for (const auto& rule : signatureRules()) {
        if (rule.mimeType == mimeType) {
            return &rule;
        }
    }
    return nullptr;
}

const SignatureRule* findRuleForExtension(const std::string& extension) {
    for (const auto& rule : signatureRules()) {
        if (rule.accepts(extension)) {
            return &rule;
        }
    }
    return nullptr;
}
