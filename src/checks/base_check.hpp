#pragma once
#include <string>
#include "filedescriptor.hpp"
#include "securityerror.hpp"

// A non-fail-fast stage: it looks at the file and appends what it finds.
class BaseCheck {
public:
    virtual ~BaseCheck() = default;
    virtual std::string name() const = 0;
    virtual void check(const FileDescriptor& file, ScanErrors& errors) const = 0;
};
