#pragma once
#include <string>

#define UPLOADGUARD_MAX_FILENAME_BYTES 255

// Storage-safe version of an uploaded name: no directory part, no "..", no
// control bytes, at most 255 bytes with the extension kept. Never throws and
// sanitizeFilename(sanitizeFilename(x)) == sanitizeFilename(x).
std::string sanitizeFilename(const std::string& name);
