// ==============================================================================
// flexscan/context.hpp - MOD-0009: Подписки и активная подписка Azure CLI
// ==============================================================================
//
// MOD-0009 context
// ADR-0003: RapidJSON для разбора вывода az
// ADR-0012: внешние вызовы через runner::CommandRunner
//
// Назначение:
// - Список включённых подписок (az account list)
// - Текущая подписка (az account show)
// - Переключение подписки (az account set)
// - ContextGuard: исходная подписка восстанавливается ровно один раз на любом
//   пути выхода (обычное завершение, ранний return, исключение)
//
// Активная подписка az — глобальное состояние профиля пользователя. Работа
// строго последовательная: в каждый момент активна одна подписка.
//
// ==============================================================================

#ifndef FLEXSCAN_CONTEXT_HPP
#define FLEXSCAN_CONTEXT_HPP

#include "flexscan/config.hpp"
#include "flexscan/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flexscan::runner {
class CommandRunner;
}

namespace flexscan::output {
class Writer;
}

namespace flexscan::context {

// ----------------------------------------------------------------------------
// Context - подписка
// ----------------------------------------------------------------------------

struct Context {
    std::string id;
    std::string name;
};

inline bool operator==(const Context& a, const Context& b) {
    return a.id == b.id && a.name == b.name;
}

inline bool operator!=(const Context& a, const Context& b) {
    return !(a == b);
}

/// "<name> (<id>)" для сообщений
std::string describe(const Context& ctx);

// ----------------------------------------------------------------------------
// Результаты
// ----------------------------------------------------------------------------

struct ContextListResult {
    bool ok = false;
    std::vector<Context> contexts;
    std::string error;

    explicit operator bool() const { return ok; }
};

struct SwitchResult {
    bool ok = false;
    ScanError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Разбор вывода az (чистые функции)
// ----------------------------------------------------------------------------

/// Разобрать вывод `az account list`
///
/// Ожидается JSON-массив объектов со строковым id. Пустой name заменяется id.
/// Объекты с полем state, отличным от "Enabled", отбрасываются.
ContextListResult parse_context_list(std::string_view output);

/// Разобрать вывод `az account show`; любая проблема -> std::nullopt
std::optional<Context> parse_current_context(std::string_view output);

// ----------------------------------------------------------------------------
// ContextSwitcher
// ----------------------------------------------------------------------------

class ContextSwitcher {
public:
    ContextSwitcher(runner::CommandRunner& runner, const config::ScanConfig& config);

    /// Включённые подписки
    ContextListResult list_contexts();

    /// Текущая подписка; отсутствие (не залогинен, не выбрана) — не ошибка
    std::optional<Context> capture_original();

    /// Сделать подписку активной
    SwitchResult activate(const Context& ctx);

    /// Вернуть исходную подписку; std::nullopt -> ничего не делать
    SwitchResult restore(const std::optional<Context>& original);

    /// argv команд (для логов и тестов)
    std::vector<std::string> list_command() const;
    std::vector<std::string> show_command() const;
    std::vector<std::string> set_command(const std::string& id) const;

private:
    runner::CommandRunner& runner_;
    const config::ScanConfig& config_;
};

// ----------------------------------------------------------------------------
// ContextGuard - восстановление исходной подписки (RAII)
// ----------------------------------------------------------------------------

class ContextGuard {
public:
    /// Запоминает текущую подписку
    ContextGuard(ContextSwitcher& switcher, output::Writer& writer);

    /// Восстанавливает подписку, если restore() ещё не вызывался
    ~ContextGuard();

    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

    const std::optional<Context>& original() const { return original_; }

    /// Восстановить исходную подписку; повторные вызовы ничего не делают
    void restore();

    bool restored() const { return restored_; }

private:
    ContextSwitcher& switcher_;
    output::Writer& writer_;
    std::optional<Context> original_;
    bool restored_ = false;
};

}  // namespace flexscan::context

#endif  // FLEXSCAN_CONTEXT_HPP
