#include "checks.hpp"
#include "helpers.hpp"
#include "filename.hpp"
#include <unordered_set>

bool ExtensionCheck::isDangerous(const std::string& extension) {
    static const std::unordered_set<std::string> dangerous = {
        ".exe", ".dll", ".bat", ".cmd", ".com", ".scr", ".pif",
        ".app", ".deb", ".pkg", ".dmg",
        ".sh", ".bash", ".zsh", ".fish",
        ".vbs", ".vbe", ".js", ".jse", ".ws", ".wsf", ".wsc", ".wsh",
        ".ps1", ".ps2", ".psc1", ".psc2",
        ".msi", ".jar",
        ".cpl", ".inf", ".reg",
        ".htaccess", ".htpasswd",
        ".php", ".phtml", ".php3", ".php4", ".php5", ".phps",
        ".asp", ".aspx", ".jsp", ".jspx",
        ".py", ".pyc", ".pyo", ".rb", ".pl",
        ".cgi",
        ".svg", ".html", ".htm"   // markup that can carry script
    };
    return dangerous.count(extension) > 0;
}

void ExtensionCheck::check(const FileDescriptor& file, ScanErrors& errors) const {
    for (const auto& ext : candidateExtensions(file.originalName)) {
        if (isDangerous(ext)) {
            errors.add("Dangerous file extension detected: " + ext);
        }
    }
}

// The name as uploaded and the name it is stored under. Sanitizing can join
// fragments into a new extension ("evil.p..hp" is stored as "evil.php").
std::vector<std::string> candidateExtensions(const std::string& originalName) {
    std::vector<std::string> result;
    const std::string raw = get_extension(originalName);
    if (!raw.empty()) {
        result.push_back(raw);
    }
    const std::string stored = get_extension(sanitizeFilename(originalName));
    if (!stored.empty() && stored != raw) {
        result.push_back(stored);
    }
    return result;
}
