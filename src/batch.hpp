#pragma once
#include "scanner.hpp"
#include "utils/printer.hpp"
#include <string>
#include <vector>

// Scans files from disk. At most maxInFlight files are held in memory and
// scanned at once; reports come back in input order. Throws
// std::runtime_error when a file cannot be read.
std::vector<ScanReport> scanFiles(const Scanner& scanner,
                                  const std::vector<std::string>& paths,
                                  const std::string& declaredType,
                                  size_t maxInFlight);

// One scan per hardware thread, at least two.
size_t default_parallel_scans();
