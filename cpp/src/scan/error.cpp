// ==============================================================================
// error.cpp - MOD-0006: Ошибки сканирования подписок
// ==============================================================================

#include "flexscan/error.hpp"

namespace flexscan {

const char* scan_error_kind_to_string(ScanErrorKind kind) {
    switch (kind) {
    case ScanErrorKind::SwitchFailed:
        return "SwitchFailed";
    case ScanErrorKind::InvocationFailed:
        return "InvocationFailed";
    case ScanErrorKind::NoJsonFound:
        return "NoJsonFound";
    case ScanErrorKind::MalformedPayload:
        return "MalformedPayload";
    }
    return "Unknown";
}

std::string ScanError::format() const {
    std::string result = scan_error_kind_to_string(kind);
    if (!message.empty()) {
        result += ": ";
        result += message;
    }
    return result;
}

}  // namespace flexscan
