// ==============================================================================
// runner.cpp - MOD-0007: Запуск команд Azure CLI
// ==============================================================================
//
// MOD-0007 runner
// ADR-0012: все внешние вызовы проходят через CommandRunner
//
// ==============================================================================

#include "flexscan/runner.hpp"

#include "flexscan/output.hpp"

namespace flexscan::runner {

namespace {

/// Первая непустая строка (без \r и краевых пробелов)
std::string first_line(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(pos, end - pos);
        size_t b = line.find_first_not_of(" \t\r");
        if (b != std::string::npos) {
            size_t e = line.find_last_not_of(" \t\r");
            return line.substr(b, e - b + 1);
        }
        pos = end + 1;
    }
    return {};
}

}  // anonymous namespace

platform::ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                           std::chrono::milliseconds timeout) {
    writer_.trace("exec: " + platform::join_command(argv));
    auto result = platform::run_process(argv, timeout);
    writer_.trace("exit: " + std::to_string(result.exit_code) +
                  (result.timed_out ? " (timed out)" : "") + ", " +
                  std::to_string(result.out.size()) + " bytes stdout");
    return result;
}

std::string describe_failure(const platform::ProcessResult& result,
                             std::chrono::milliseconds timeout) {
    if (!result.launched) {
        return result.error.empty() ? "command could not be started" : result.error;
    }
    if (result.timed_out) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
        return "command timed out after " + std::to_string(seconds) + "s";
    }
    std::string message = "command exited with code " + std::to_string(result.exit_code);
    std::string detail = first_line(result.err);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

}  // namespace flexscan::runner
