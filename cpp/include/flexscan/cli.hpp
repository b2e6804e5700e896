// ==============================================================================
// flexscan/cli.hpp - MOD-0002: CLI парсинг
// ==============================================================================
//
// MOD-0002 cli
// ADR-0006: собственный слой CLI (help/errors в стиле clap)
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef FLEXSCAN_CLI_HPP
#define FLEXSCAN_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flexscan::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Сканирование подписок (команда по умолчанию)
///
/// Незаданные опции не трогают значения из файла конфигурации.
struct ScanCommand {
    std::optional<std::filesystem::path> config;          // -c, --config
    std::optional<std::filesystem::path> full_output;     // -o, --full-output
    std::optional<std::filesystem::path> summary_output;  // -s, --summary-output
    std::optional<std::string> az_path;                   // --az
    std::optional<std::uint32_t> timeout_seconds;         // --timeout
    std::vector<std::string> extensions;                  // --extension (repeatable)
    bool skip_install = false;                            // --skip-install
    bool no_scope_per_call = false;                       // --no-scope-per-call
};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<ScanCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика и результат
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT =
    "Scan every enabled Azure subscription for Flex Consumption migration eligibility";

}  // namespace flexscan::cli

#endif  // FLEXSCAN_CLI_HPP
