#include "checks.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>

namespace {

struct ContentPattern {
    const char* name;
    bool (*matches)(const std::vector<uint8_t>& blob, size_t window);
    const char* message;
};

bool isPE(const std::vector<uint8_t>& blob, size_t) {
    return bytes_at(blob, 0, {'M', 'Z'});
}

bool isELF(const std::vector<uint8_t>& blob, size_t) {
    return bytes_at(blob, 0, {0x7F, 'E', 'L', 'F'});
}

bool isMachO(const std::vector<uint8_t>& blob, size_t) {
    return bytes_at(blob, 0, {0xFE, 0xED, 0xFA, 0xCE}) ||
           bytes_at(blob, 0, {0xFE, 0xED, 0xFA, 0xCF}) ||
           bytes_at(blob, 0, {0xCE, 0xFA, 0xED, 0xFE}) ||
           bytes_at(blob, 0, {0xCF, 0xFA, 0xED, 0xFE});
}

bool hasScriptTag(const std::vector<uint8_t>& blob, size_t window) {
    return contains_nocase(blob, window, "<script");
}

bool hasJavascriptProtocol(const std::vector<uint8_t>& blob, size_t window) {
    return contains_nocase(blob, window, "javascript:");
}

// on<event>= as an attribute: "on" must start a token and be followed by at
// least three letters, so words like "one=" or "button=" do not count.
bool hasEventHandler(const std::vector<uint8_t>& blob, size_t window) {
    const size_t end = std::min(window, blob.size());
    auto lower = [&](size_t i) { return std::tolower(blob[i]); };

    for (size_t i = 0; i + 2 < end; ++i) {
        if (lower(i) != 'o' || lower(i + 1) != 'n') continue;
        if (i > 0) {
            const uint8_t prev = blob[i - 1];
            if (!(std::isspace(prev) || prev == '"' || prev == '\'' ||
                  prev == '/' || prev == '<' || prev == ';')) {
                continue;
            }
        }

        size_t j = i + 2;
        while (j < end && lower(j) >= 'a' && lower(j) <= 'z') ++j;
        if (j - (i + 2) < 3) continue;
        while (j < end && std::isspace(blob[j])) ++j;
        if (j < end && blob[j] == '=') return true;
    }
    return false;
}

bool hasEmbeddedFrame(const std::vector<uint8_t>& blob, size_t window) {
    return contains_nocase(blob, window, "<iframe");
}

bool hasPluginObject(const std::vector<uint8_t>& blob, size_t window) {
    return contains_nocase(blob, window, "<embed") ||
           contains_nocase(blob, window, "<object");
}

bool hasEvalCall(const std::vector<uint8_t>& blob, size_t window) {
    return contains_nocase(blob, window, "eval(");
}

bool hasPhpTag(const std::vector<uint8_t>& blob, size_t window) {
    return contains_nocase(blob, window, "<?php") ||
           contains_nocase(blob, window, "<?=");
}

const ContentPattern patterns[] = {
    {"pe-header",     isPE,                  "Windows executable detected (PE/MZ header)"},
    {"elf-header",    isELF,                 "Linux executable detected (ELF header)"},
    {"macho-header",  isMachO,               "macOS executable detected (Mach-O header)"},
    {"script-tag",    hasScriptTag,          "Embedded <script> tag detected"},
    {"js-protocol",   hasJavascriptProtocol, "javascript: protocol handler detected"},
    {"event-handler", hasEventHandler,       "Inline event handler attribute detected"},
    {"iframe-tag",    hasEmbeddedFrame,      "Embedded <iframe> tag detected"},
    {"plugin-tag",    hasPluginObject,       "Embedded <embed>/<object> tag detected"},
    {"eval-call",     hasEvalCall,           "JavaScript eval() call detected"},
    {"php-tag",       hasPhpTag,             "PHP code detected in file"},
};

} // namespace

void ContentCheck::check(const FileDescriptor& file, ScanErrors& errors) const {
    if (file.content.empty()) {
        return;
    }
    for (const auto& pattern : patterns) {
        if (pattern.matches(file.content, scanWindow)) {
            Logger::debug(std::string("content: matched ") + pattern.name);
            errors.add(pattern.message);
        }
    }
}
