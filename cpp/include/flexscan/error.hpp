// ==============================================================================
// flexscan/error.hpp - MOD-0006: Ошибки сканирования подписок
// ==============================================================================
//
// MOD-0006 error
//
// Все ошибки здесь относятся к одной подписке и восстановимы:
// подписка пропускается, сканирование продолжается.
//
// ==============================================================================

#ifndef FLEXSCAN_ERROR_HPP
#define FLEXSCAN_ERROR_HPP

#include <string>

namespace flexscan {

enum class ScanErrorKind {
    SwitchFailed,      // az account set завершился с ошибкой
    InvocationFailed,  // команда листинга: запуск/таймаут/ненулевой код
    NoJsonFound,       // в выводе нет строки, начинающейся с { или [
    MalformedPayload   // JSON не разобран или не той формы
};

/// Имя вида ошибки ("SwitchFailed", ...)
const char* scan_error_kind_to_string(ScanErrorKind kind);

struct ScanError {
    ScanErrorKind kind = ScanErrorKind::InvocationFailed;
    std::string message;
    std::string context_id;

    /// "<kind>: <message>"
    std::string format() const;
};

}  // namespace flexscan

#endif  // FLEXSCAN_ERROR_HPP
