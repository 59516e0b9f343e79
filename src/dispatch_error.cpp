#include "dispatch_error.hpp"

namespace dispatch {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnsupportedStrategy: return "UnsupportedStrategy";
        case ErrorCode::EmptyPool: return "EmptyPool";
        case ErrorCode::ProfileNotFound: return "ProfileNotFound";
        case ErrorCode::NoConnectionAvailable: return "NoConnectionAvailable";
        case ErrorCode::InvalidProfile: return "InvalidProfile";
        default: return "Unknown";
    }
}

} // namespace dispatch
