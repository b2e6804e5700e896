// ==============================================================================
// flexscan/aggregate.hpp - MOD-0012: Накопление записей и сводка
// ==============================================================================
//
// MOD-0012 aggregate
//
// Записи хранятся в порядке обработки подписок. Сводка группирует их по
// context_id в порядке первого появления и стабильно сортирует по
// total_apps по убыванию: при равенстве сохраняется порядок подписок.
//
// ==============================================================================

#ifndef FLEXSCAN_AGGREGATE_HPP
#define FLEXSCAN_AGGREGATE_HPP

#include "flexscan/normalize.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace flexscan::aggregate {

/// Сводка по одной подписке; total_apps == eligible_apps + ineligible_apps
struct ContextSummary {
    std::string context_id;
    std::string context_name;
    std::size_t total_apps = 0;
    std::size_t eligible_apps = 0;
    std::size_t ineligible_apps = 0;
};

/// Итоги по всем сводкам (для консольного отчёта)
struct Totals {
    std::size_t contexts_with_apps = 0;
    std::size_t total_apps = 0;
    std::size_t eligible_apps = 0;
    std::size_t ineligible_apps = 0;
};

class Aggregator {
public:
    /// Добавить записи одной подписки в конец
    void append(std::vector<normalize::EligibilityRecord> records);

    const std::vector<normalize::EligibilityRecord>& records() const { return records_; }

    bool empty() const { return records_.empty(); }
    std::size_t size() const { return records_.size(); }

    /// Сводка по подпискам (без побочных эффектов)
    std::vector<ContextSummary> summarize() const;

private:
    std::vector<normalize::EligibilityRecord> records_;
};

/// Сложить сводки
Totals compute_totals(const std::vector<ContextSummary>& summaries);

}  // namespace flexscan::aggregate

#endif  // FLEXSCAN_AGGREGATE_HPP
