// ==============================================================================
// config.cpp - MOD-0005: Конфигурация сканирования
// ==============================================================================
//
// MOD-0005 config
// ADR-0004: yaml-cpp для конфигурационных файлов
//
// ==============================================================================

#include "flexscan/config.hpp"

#include "flexscan/cli.hpp"
#include "flexscan/platform.hpp"

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace flexscan::config {

namespace {

/// Известные ключи верхнего уровня
bool is_known_key(const std::string& key) {
    return key == "az_path" || key == "full_output" || key == "summary_output" ||
           key == "skip_install" || key == "timeout_seconds" || key == "scope_per_call" ||
           key == "extensions";
}

}  // anonymous namespace

ConfigResult parse_config(const std::string& yaml_text, const ScanConfig& base) {
    ConfigResult result;
    result.ok = false;
    result.config = base;

    try {
        YAML::Node root = YAML::Load(yaml_text);

        // Пустой файл = все значения по умолчанию
        if (!root || root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = "configuration root must be a mapping";
            return result;
        }

        for (const auto& entry : root) {
            auto key = entry.first.as<std::string>();
            if (!is_known_key(key)) {
                result.error = "unknown configuration key '" + key + "'";
                return result;
            }
        }

        ScanConfig& cfg = result.config;
        if (root["az_path"]) {
            cfg.az_path = root["az_path"].as<std::string>();
            if (cfg.az_path.empty()) {
                result.error = "'az_path' must not be empty";
                return result;
            }
        }
        if (root["full_output"]) {
            cfg.full_output = platform::path_from_utf8(root["full_output"].as<std::string>());
        }
        if (root["summary_output"]) {
            cfg.summary_output = platform::path_from_utf8(root["summary_output"].as<std::string>());
        }
        if (root["skip_install"]) {
            cfg.skip_install = root["skip_install"].as<bool>();
        }
        if (root["scope_per_call"]) {
            cfg.scope_per_call = root["scope_per_call"].as<bool>();
        }
        if (root["timeout_seconds"]) {
            auto seconds = root["timeout_seconds"].as<std::int64_t>();
            if (seconds <= 0 || seconds > 86400) {
                result.error = "'timeout_seconds' must be between 1 and 86400";
                return result;
            }
            cfg.timeout_seconds = static_cast<std::uint32_t>(seconds);
        }
        if (root["extensions"]) {
            const auto& node = root["extensions"];
            if (!node.IsSequence()) {
                result.error = "'extensions' must be a list of extension names";
                return result;
            }
            cfg.extensions.clear();
            for (const auto& ext : node) {
                cfg.extensions.push_back(ext.as<std::string>());
            }
        }

        result.ok = true;
        return result;

    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

ConfigResult load_config(const std::filesystem::path& path, const ScanConfig& base) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ConfigResult result;
        result.config = base;
        result.error = "cannot open configuration file: " + platform::path_to_utf8(path);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config(buffer.str(), base);
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

void apply_overrides(ScanConfig& config, const cli::ScanCommand& cmd) {
    if (cmd.full_output) {
        config.full_output = *cmd.full_output;
    }
    if (cmd.summary_output) {
        config.summary_output = *cmd.summary_output;
    }
    if (cmd.az_path) {
        config.az_path = *cmd.az_path;
    }
    if (cmd.timeout_seconds) {
        config.timeout_seconds = *cmd.timeout_seconds;
    }
    if (cmd.skip_install) {
        config.skip_install = true;
    }
    if (cmd.no_scope_per_call) {
        config.scope_per_call = false;
    }
    // --extension дополняет список из файла
    for (const auto& ext : cmd.extensions) {
        config.extensions.push_back(ext);
    }
}

ConfigResult resolve(const cli::ScanCommand& cmd) {
    ConfigResult result;
    if (cmd.config) {
        result = load_config(*cmd.config);
        if (!result.ok) {
            return result;
        }
    } else {
        result.ok = true;
    }
    apply_overrides(result.config, cmd);
    return result;
}

}  // namespace flexscan::config
