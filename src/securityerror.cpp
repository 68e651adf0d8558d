#include "securityerror.hpp"

void ScanErrors::raiseIfAny(const std::string& message) const {
    if (!errors_.empty()) {
        throw SecurityError(message, errors_);
    }
}
