#include "filename.hpp"

namespace {

bool isControl(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

// One pass over the three strip rules. Removing a byte can bring two dots
// together ("./." or ".\x01."), so the caller repeats until nothing changes.
std::string stripOnce(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(in[i]);
        if (c == '.' && i + 1 < in.size() && in[i + 1] == '.') {
            ++i;
            continue;
        }
        if (c == '/' || c == '\\' || isControl(c)) {
            continue;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

// Largest cut <= max that does not split a UTF-8 sequence.
size_t utf8Boundary(const std::string& s, size_t max) {
    if (max >= s.size()) return s.size();
    size_t cut = max;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

std::string truncate(const std::string& name) {
    const size_t limit = UPLOADGUARD_MAX_FILENAME_BYTES;
    if (name.size() <= limit) {
        return name;
    }

    const size_t dot = name.find_last_of('.');
    const bool keepExtension = dot != std::string::npos && dot > 0 &&
                               name.size() - dot < limit;
    if (!keepExtension) {
        return name.substr(0, utf8Boundary(name, limit));
    }

    const std::string ext = name.substr(dot);
    std::string stem = name.substr(0, utf8Boundary(name, limit - ext.size()));
    // stem ending in '.' would meet the extension's dot
    while (!stem.empty() && stem.back() == '.') {
        stem.pop_back();
    }
    return stem + ext;
}

} // namespace

std::string sanitizeFilename(const std::string& name) {
    std::string current = name;
    while (true) {
        std::string next = stripOnce(current);
        if (next == current) break;
        current = std::move(next);
    }
    return truncate(current);
}
