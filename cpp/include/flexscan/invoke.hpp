// ==============================================================================
// flexscan/invoke.hpp - MOD-0010: Команда листинга миграции Flex Consumption
// ==============================================================================
//
// MOD-0010 invoke
// ADR-0012: внешние вызовы через runner::CommandRunner
//
// Назначение:
// - `az functionapp flex-migration list` для одной подписки
// - Необязательная подготовка: `az extension add --upgrade` для расширений
//
// Одна попытка на подписку, без повторов. Ненулевой код, таймаут или ошибка
// запуска -> InvocationFailed.
//
// ==============================================================================

#ifndef FLEXSCAN_INVOKE_HPP
#define FLEXSCAN_INVOKE_HPP

#include "flexscan/config.hpp"
#include "flexscan/context.hpp"
#include "flexscan/error.hpp"

#include <string>
#include <vector>

namespace flexscan::runner {
class CommandRunner;
}

namespace flexscan::output {
class Writer;
}

namespace flexscan::invoke {

struct InvokeResult {
    bool ok = false;
    std::string output;  // stdout команды как есть
    ScanError error;

    explicit operator bool() const { return ok; }
};

class CommandInvoker {
public:
    CommandInvoker(runner::CommandRunner& runner, const config::ScanConfig& config);

    /// Запустить листинг для активной подписки
    InvokeResult invoke(const context::Context& ctx);

    /// Добавить/обновить расширения из конфигурации
    /// @return количество неудачных установок (каждая — предупреждение)
    size_t prepare_tooling(output::Writer& writer);

    std::vector<std::string> listing_command(const context::Context& ctx) const;
    std::vector<std::string> extension_command(const std::string& extension) const;

private:
    runner::CommandRunner& runner_;
    const config::ScanConfig& config_;
};

}  // namespace flexscan::invoke

#endif  // FLEXSCAN_INVOKE_HPP
