// ==============================================================================
// aggregate.cpp - MOD-0012: Накопление записей и сводка
// ==============================================================================

#include "flexscan/aggregate.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace flexscan::aggregate {

void Aggregator::append(std::vector<normalize::EligibilityRecord> records) {
    if (records_.empty()) {
        records_ = std::move(records);
        return;
    }
    records_.insert(records_.end(), std::make_move_iterator(records.begin()),
                    std::make_move_iterator(records.end()));
}

std::vector<ContextSummary> Aggregator::summarize() const {
    std::vector<ContextSummary> summaries;
    std::unordered_map<std::string, size_t> index;

    for (const auto& rec : records_) {
        auto [it, inserted] = index.emplace(rec.context_id, summaries.size());
        if (inserted) {
            ContextSummary s;
            s.context_id = rec.context_id;
            s.context_name = rec.context_name;
            summaries.push_back(std::move(s));
        }

        auto& s = summaries[it->second];
        if (rec.eligibility == normalize::Eligibility::Eligible) {
            ++s.eligible_apps;
        } else {
            ++s.ineligible_apps;
        }
        s.total_apps = s.eligible_apps + s.ineligible_apps;
    }

    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const ContextSummary& a, const ContextSummary& b) {
                         return a.total_apps > b.total_apps;
                     });
    return summaries;
}

Totals compute_totals(const std::vector<ContextSummary>& summaries) {
    Totals totals;
    for (const auto& s : summaries) {
        if (s.total_apps > 0) {
            ++totals.contexts_with_apps;
        }
        totals.total_apps += s.total_apps;
        totals.eligible_apps += s.eligible_apps;
        totals.ineligible_apps += s.ineligible_apps;
    }
    return totals;
}

}  // namespace flexscan::aggregate
