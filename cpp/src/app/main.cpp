// ==============================================================================
// main.cpp - MOD-0001: Точка входа приложения
// ==============================================================================
//
// MOD-0001 app
// GUIDE-0001 G-024: перехват исключений на границе app
//
// Точка входа:
// 1. Парсинг argv через MOD-0002 cli
// 2. Создание Writer (MOD-0003 output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// ==============================================================================

#include "flexscan/cli.hpp"
#include "flexscan/config.hpp"
#include "flexscan/output.hpp"
#include "flexscan/runner.hpp"
#include "flexscan/scan.hpp"

#include <exception>
#include <iostream>
#include <type_traits>

namespace {

// ----------------------------------------------------------------------------
// Сканирование
// ----------------------------------------------------------------------------

int run_scan(const flexscan::cli::ScanCommand& cmd, flexscan::output::Writer& writer) {
    using namespace flexscan;

    auto resolved = config::resolve(cmd);
    if (!resolved) {
        writer.error(resolved.error);
        return 1;
    }
    const config::ScanConfig& cfg = resolved.config;

    writer.debug("Azure CLI: " + cfg.az_path + ", timeout " +
                 std::to_string(cfg.timeout_seconds) + "s, per-call scope " +
                 (cfg.scope_per_call ? "on" : "off"));

    runner::ProcessRunner process_runner(writer);
    scan::Scanner scanner(cfg, process_runner, writer);
    auto outcome = scanner.run();

    if (outcome.contexts_skipped > 0) {
        writer.debug(std::to_string(outcome.contexts_skipped) + " of " +
                     std::to_string(outcome.contexts_total) + " subscription(s) skipped");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace flexscan;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга: сообщение как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_scan(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // GUIDE-0001 G-024: перехват исключений на границе app, формат "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
