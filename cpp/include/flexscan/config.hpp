// ==============================================================================
// flexscan/config.hpp - MOD-0005: Конфигурация сканирования
// ==============================================================================
//
// MOD-0005 config
// ADR-0004: yaml-cpp для конфигурационных файлов
//
// Назначение:
// - ScanConfig со значениями по умолчанию
// - Загрузка YAML-файла конфигурации
// - Наложение опций командной строки поверх файла
//
// Приоритет: значения по умолчанию < файл конфигурации < флаги CLI
//
// ==============================================================================

#ifndef FLEXSCAN_CONFIG_HPP
#define FLEXSCAN_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace flexscan::cli {
struct ScanCommand;
}

namespace flexscan::config {

// ----------------------------------------------------------------------------
// Значения по умолчанию
// ----------------------------------------------------------------------------

constexpr const char* DEFAULT_AZ_PATH = "az";
constexpr const char* DEFAULT_FULL_OUTPUT = "flex_migration_all.json";
constexpr const char* DEFAULT_SUMMARY_OUTPUT = "flex_migration_summary.json";
constexpr std::uint32_t DEFAULT_TIMEOUT_SECONDS = 300;

// ----------------------------------------------------------------------------
// ScanConfig
// ----------------------------------------------------------------------------

struct ScanConfig {
    std::string az_path = DEFAULT_AZ_PATH;
    std::filesystem::path full_output = DEFAULT_FULL_OUTPUT;
    std::filesystem::path summary_output = DEFAULT_SUMMARY_OUTPUT;
    bool skip_install = false;
    std::uint32_t timeout_seconds = DEFAULT_TIMEOUT_SECONDS;

    /// Передавать --subscription в команду листинга (не полагаться только на az account set)
    bool scope_per_call = true;

    /// Расширения az для `az extension add --upgrade` перед сканированием
    std::vector<std::string> extensions;

    std::chrono::milliseconds timeout() const {
        return std::chrono::seconds(timeout_seconds);
    }
};

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

struct ConfigResult {
    bool ok = false;
    ScanConfig config;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML-текст поверх base
ConfigResult parse_config(const std::string& yaml_text, const ScanConfig& base = ScanConfig{});

/// Загрузить YAML-файл поверх base
ConfigResult load_config(const std::filesystem::path& path, const ScanConfig& base = ScanConfig{});

/// Применить флаги CLI поверх конфигурации
void apply_overrides(ScanConfig& config, const cli::ScanCommand& cmd);

/// Итоговая конфигурация: defaults -> --config (если задан) -> флаги CLI
ConfigResult resolve(const cli::ScanCommand& cmd);

}  // namespace flexscan::config

#endif  // FLEXSCAN_CONFIG_HPP
