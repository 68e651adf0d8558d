#include "checks.hpp"
#include "file_type_detector.hpp"
#include "logger.hpp"

void SignatureCheck::check(const FileDescriptor& file, ScanErrors& errors) const {
    if (!enabled) {
        return;
    }

    const std::vector<std::string> extensions = candidateExtensions(file.originalName);
    if (extensions.empty()) {
        Logger::debug("signature: no extension on '" + file.originalName + "', skipping");
        return;
    }

    const std::string detected = detectFileType(file.content);
    if (detected == UNKNOWN_FILE_TYPE) {
        Logger::debug("signature: content type not recognised, skipping");
        return;
    }

    const SignatureRule* rule = findSignatureRule(detected);
    for (const auto& ext : extensions) {
        if (rule && rule->accepts(ext)) {
            continue;
        }
        // Extensions outside the table carry no claim to contradict.
        if (!findRuleForExtension(ext)) {
            Logger::debug("signature: " + ext + " has no known signature, skipping");
            continue;
        }
        errors.add("File signature mismatch: content is of type " + detected +
                   " but extension claims " + ext);
    }
}
