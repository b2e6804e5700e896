// ==============================================================================
// flexscan/platform.hpp - MOD-0004: Платформенные абстракции
// ==============================================================================
//
// MOD-0004 platform
// ADR-0010: std::filesystem::path + явные преобразования path <-> UTF-8
// ADR-0012: внешние процессы запускаются без shell (POSIX), с таймаутом
//
// Назначение:
// - Преобразования путей UTF-8
// - TTY detection для цветного вывода
// - Запуск внешнего процесса с захватом stdout/stderr и таймаутом
//
// ==============================================================================

#ifndef FLEXSCAN_PLATFORM_HPP
#define FLEXSCAN_PLATFORM_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace flexscan::platform {

// ----------------------------------------------------------------------------
// Пути (ADR-0010)
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// Терминал
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Внешние процессы (ADR-0012)
// ----------------------------------------------------------------------------

/// Результат запуска внешнего процесса
struct ProcessResult {
    bool launched = false;   // процесс был запущен
    bool timed_out = false;  // процесс убит по таймауту
    int exit_code = -1;      // код выхода (-1 если не запущен/убит)
    std::string out;         // захваченный stdout
    std::string err;         // захваченный stderr
    std::string error;       // описание ошибки запуска

    /// Процесс запущен, завершился сам и вернул 0
    bool succeeded() const { return launched && !timed_out && exit_code == 0; }
};

/// Запустить процесс и дождаться завершения
///
/// @param argv argv[0] ищется в PATH; на POSIX shell не используется
/// @param timeout по истечении процесс убивается, timed_out = true
ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

/// Склеить argv в одну строку для логов
std::string join_command(const std::vector<std::string>& argv);

}  // namespace flexscan::platform

#endif  // FLEXSCAN_PLATFORM_HPP
