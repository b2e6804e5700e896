// ==============================================================================
// cli.cpp - MOD-0002: CLI парсинг
// ==============================================================================
//
// MOD-0002 cli
// ADR-0006: собственный слой CLI (help/errors в стиле clap)
//
// ==============================================================================

#include "flexscan/cli.hpp"

#include "flexscan/platform.hpp"

#include <cctype>
#include <cstring>

namespace flexscan::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg +
           "\n\n"
           "Usage: flexscan [OPTIONS]\n\n"
           "For more information, try '--help'.\n";
}

/// Разбор "--name value" и "--name=value"
///
/// @return true если arg — это опция long/short; value заполнен при наличии значения
bool match_option(const char* arg, const char* short_name, const char* long_name, int& i, int argc,
                  char** argv, std::optional<std::string>& value) {
    value.reset();
    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        if (i + 1 < argc) {
            ++i;
            value = argv[i];
        }
        return true;
    }
    const size_t len = std::strlen(long_name);
    if (std::strncmp(arg, long_name, len) == 0 && arg[len] == '=') {
        value = std::string(arg + len + 1);
        return true;
    }
    return false;
}

std::string missing_value(const char* display) {
    return render_usage_error(std::string("error: a value is required for '") + display +
                              "' but none was supplied");
}

std::optional<std::uint32_t> parse_seconds(const std::string& text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint32_t>(c - '0');
    }
    if (value == 0) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("flexscan ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: flexscan [OPTIONS]\n"
           "\n"
           "Options:\n"
           "  -c, --config <FILE>             YAML configuration file\n"
           "  -o, --full-output <PATH>        Full record export [default: "
           "flex_migration_all.json]\n"
           "  -s, --summary-output <PATH>     Per-subscription summary export [default: "
           "flex_migration_summary.json]\n"
           "      --skip-install              Skip the Azure CLI extension install/update step\n"
           "      --az <PATH>                 Azure CLI executable [default: az]\n"
           "      --timeout <SECONDS>         Timeout for each Azure CLI call [default: 300]\n"
           "      --extension <NAME>          Azure CLI extension to add or upgrade before "
           "scanning\n"
           "      --no-scope-per-call         Rely on 'az account set' only, do not pass "
           "--subscription\n"
           "  -q                              Suppress informational output\n"
           "  -v...                           Print verbose output\n"
           "  -h, --help                      Print help\n"
           "  -V, --version                   Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Scan all enabled subscriptions with default output files:\n"
           "        ./flexscan\n"
           "\n"
           "    Scan without touching installed extensions, custom output paths:\n"
           "        ./flexscan --skip-install -o all.json -s summary.json\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;

    ScanCommand scan;
    std::optional<std::string> value;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (arg[0] == '-' && arg[1] == 'v' && std::strspn(arg + 1, "v") ==
                                                         std::strlen(arg + 1)) {
            // -v, -vv, -vvv
            result.global.verbose += static_cast<int>(std::strlen(arg + 1));
        } else if (str_eq(arg, "--skip-install")) {
            scan.skip_install = true;
        } else if (str_eq(arg, "--no-scope-per-call")) {
            scan.no_scope_per_call = true;
        } else if (match_option(arg, "-c", "--config", i, argc, argv, value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--config <FILE>");
                return result;
            }
            scan.config = platform::path_from_utf8(*value);
        } else if (match_option(arg, "-o", "--full-output", i, argc, argv, value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--full-output <PATH>");
                return result;
            }
            scan.full_output = platform::path_from_utf8(*value);
        } else if (match_option(arg, "-s", "--summary-output", i, argc, argv, value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--summary-output <PATH>");
                return result;
            }
            scan.summary_output = platform::path_from_utf8(*value);
        } else if (match_option(arg, nullptr, "--az", i, argc, argv, value)) {
            if (!value || value->empty()) {
                result.diagnostic.stderr_message = missing_value("--az <PATH>");
                return result;
            }
            scan.az_path = *value;
        } else if (match_option(arg, nullptr, "--extension", i, argc, argv, value)) {
            if (!value || value->empty()) {
                result.diagnostic.stderr_message = missing_value("--extension <NAME>");
                return result;
            }
            scan.extensions.push_back(*value);
        } else if (match_option(arg, nullptr, "--timeout", i, argc, argv, value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--timeout <SECONDS>");
                return result;
            }
            auto seconds = parse_seconds(*value);
            if (!seconds) {
                result.diagnostic.stderr_message = render_usage_error(
                    "error: invalid value '" + *value +
                    "' for '--timeout <SECONDS>': expected a positive number of seconds");
                return result;
            }
            scan.timeout_seconds = seconds;
        } else {
            result.diagnostic.stderr_message =
                render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
            return result;
        }
    }

    result.ok = true;
    result.command = scan;
    return result;
}

}  // namespace flexscan::cli
