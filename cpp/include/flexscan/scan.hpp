// ==============================================================================
// flexscan/scan.hpp - MOD-0014: Конвейер сканирования подписок
// ==============================================================================
//
// MOD-0014 scan
// ADR-0012: внешние вызовы через runner::CommandRunner
//
// Поток управления:
//   подготовка расширений -> запомнить исходную подписку -> список подписок ->
//   для каждой: переключить -> листинг -> извлечь JSON -> нормализовать ->
//   накопить -> сводка -> экспорт -> консоль -> восстановить подписку
//
// Ошибка одной подписки не прерывает обход: предупреждение и пропуск.
// Исходная подписка восстанавливается ровно один раз на любом пути выхода.
//
// ==============================================================================

#ifndef FLEXSCAN_SCAN_HPP
#define FLEXSCAN_SCAN_HPP

#include "flexscan/aggregate.hpp"
#include "flexscan/config.hpp"
#include "flexscan/context.hpp"
#include "flexscan/normalize.hpp"

#include <cstddef>
#include <vector>

namespace flexscan::runner {
class CommandRunner;
}

namespace flexscan::output {
class Writer;
}

namespace flexscan::scan {

/// Итог одного прогона
struct RunOutcome {
    std::size_t contexts_total = 0;
    std::size_t contexts_skipped = 0;
    std::vector<normalize::EligibilityRecord> records;
    std::vector<aggregate::ContextSummary> summaries;
    bool files_written = false;
};

class Scanner {
public:
    Scanner(const config::ScanConfig& config, runner::CommandRunner& runner,
            output::Writer& writer);

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /// Полный прогон. Исключения экспорта пробрасываются наружу
    /// (подписка к этому моменту уже восстановлена деструктором guard).
    RunOutcome run();

private:
    /// Обработать одну подписку
    /// @return false, если подписка пропущена
    bool scan_context(const context::Context& ctx, context::ContextSwitcher& switcher,
                      aggregate::Aggregator& aggregator);

    void skip(const context::Context& ctx, const ScanError& error);

    const config::ScanConfig& config_;
    runner::CommandRunner& runner_;
    output::Writer& writer_;
};

}  // namespace flexscan::scan

#endif  // FLEXSCAN_SCAN_HPP
