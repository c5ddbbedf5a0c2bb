#include "psguard/types.h"

namespace psguard {

const char* error_type_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::SECURITY:       return "Security";
        case ErrorCode::TIMEOUT:        return "Timeout";
        case ErrorCode::EXECUTION:      return "Execution";
        case ErrorCode::INVALID_PARAMS: return "InvalidParams";
        case ErrorCode::NONE:           return "";
    }
    return "";
}

} // namespace psguard
