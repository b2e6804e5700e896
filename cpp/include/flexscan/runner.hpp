// ==============================================================================
// flexscan/runner.hpp - MOD-0007: Запуск команд Azure CLI
// ==============================================================================
//
// MOD-0007 runner
// ADR-0012: все внешние вызовы проходят через CommandRunner
//
// Назначение:
// - Абстракция запуска внешней команды (подменяется в тестах)
// - ProcessRunner поверх platform::run_process
// - Описание неудачного запуска одной строкой для логов
//
// ==============================================================================

#ifndef FLEXSCAN_RUNNER_HPP
#define FLEXSCAN_RUNNER_HPP

#include "flexscan/platform.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace flexscan::output {
class Writer;
}

namespace flexscan::runner {

/// Запускает внешнюю команду и возвращает её вывод
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Запустить argv и дождаться завершения (или таймаута)
    virtual platform::ProcessResult run(const std::vector<std::string>& argv,
                                        std::chrono::milliseconds timeout) = 0;

protected:
    CommandRunner() = default;
};

/// Настоящие процессы; каждая команда логируется на уровне trace
class ProcessRunner : public CommandRunner {
public:
    explicit ProcessRunner(output::Writer& writer) : writer_(writer) {}

    platform::ProcessResult run(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout) override;

private:
    output::Writer& writer_;
};

/// Почему запуск считается неудачным: ошибка запуска, таймаут или код выхода
/// с первой непустой строкой stderr
std::string describe_failure(const platform::ProcessResult& result,
                             std::chrono::milliseconds timeout);

}  // namespace flexscan::runner

#endif  // FLEXSCAN_RUNNER_HPP
