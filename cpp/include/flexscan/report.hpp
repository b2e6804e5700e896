// ==============================================================================
// flexscan/report.hpp - MOD-0013: Экспорт результатов и консольная сводка
// ==============================================================================
//
// MOD-0013 report
// ADR-0003: RapidJSON для JSON сериализации
//
// Назначение:
// - Полный список записей -> JSON-массив в файл
// - Сводка по подпискам -> JSON-массив в файл
// - Таблица и итоги в stdout
//
// Файлы пишутся в UTF-8 и перезаписываются. Ошибка открытия/записи файла ->
// std::runtime_error.
//
// ==============================================================================

#ifndef FLEXSCAN_REPORT_HPP
#define FLEXSCAN_REPORT_HPP

#include "flexscan/aggregate.hpp"
#include "flexscan/normalize.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace flexscan::output {
class Writer;
}

namespace flexscan::report {

/// Pretty JSON-массив записей (ключи: context_id, context_name, app_name,
/// resource_group, eligibility, reason)
std::string render_records_json(const std::vector<normalize::EligibilityRecord>& records);

/// Pretty JSON-массив сводок (ключи: context_id, context_name, total_apps,
/// eligible_apps, ineligible_apps)
std::string render_summary_json(const std::vector<aggregate::ContextSummary>& summaries);

void export_full(const std::vector<normalize::EligibilityRecord>& records,
                 const std::filesystem::path& path);

void export_summary(const std::vector<aggregate::ContextSummary>& summaries,
                    const std::filesystem::path& path);

/// Таблица по подпискам и четыре итога в stdout
void print_console_summary(const std::vector<aggregate::ContextSummary>& summaries,
                           const std::vector<normalize::EligibilityRecord>& records,
                           output::Writer& writer);

}  // namespace flexscan::report

#endif  // FLEXSCAN_REPORT_HPP
