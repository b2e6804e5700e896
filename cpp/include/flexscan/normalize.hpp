// ==============================================================================
// flexscan/normalize.hpp - MOD-0011: Нормализация отчёта о миграции
// ==============================================================================
//
// MOD-0011 normalize
// ADR-0003: RapidJSON
//
// Назначение:
// - ValidatedPayload: оба списка приложений, по умолчанию пустые
// - EligibilityRecord: одна плоская запись на приложение
//
// Порядок записей внутри подписки: все eligible_apps, затем все
// ineligible_apps, каждый список в исходном порядке.
//
// ==============================================================================

#ifndef FLEXSCAN_NORMALIZE_HPP
#define FLEXSCAN_NORMALIZE_HPP

#include "flexscan/context.hpp"
#include "flexscan/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flexscan::normalize {

// ----------------------------------------------------------------------------
// Данные
// ----------------------------------------------------------------------------

enum class Eligibility { Eligible, Ineligible };

/// "Eligible" / "Ineligible"
const char* eligibility_to_string(Eligibility e);

/// Приложение из ответа az
struct AppEntry {
    std::string name;
    std::string resource_group;
    std::optional<std::string> reason;  // только для ineligible_apps
};

/// Разобранный ответ; отсутствующие поля = пустые списки
struct ValidatedPayload {
    std::vector<AppEntry> eligible_apps;
    std::vector<AppEntry> ineligible_apps;
};

/// Запись итогового отчёта. reason всегда пуст для Eligible.
struct EligibilityRecord {
    std::string context_id;
    std::string context_name;
    std::string app_name;
    std::string resource_group;
    Eligibility eligibility = Eligibility::Eligible;
    std::optional<std::string> reason;
};

// ----------------------------------------------------------------------------
// Результаты
// ----------------------------------------------------------------------------

struct PayloadResult {
    bool ok = false;
    ValidatedPayload payload;
    ScanError error;

    explicit operator bool() const { return ok; }
};

struct NormalizeResult {
    bool ok = false;
    std::vector<EligibilityRecord> records;
    ScanError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Разобрать JSON целиком (мусор после документа — ошибка разбора)
///
/// Корень — объект. eligible_apps / ineligible_apps: нет или null -> пусто,
/// не массив -> MalformedPayload. Элемент не объект -> MalformedPayload.
PayloadResult parse_payload(std::string_view json);

/// Записи для одной подписки
std::vector<EligibilityRecord> normalize(const ValidatedPayload& payload,
                                         const context::Context& ctx);

/// parse_payload + normalize
NormalizeResult normalize_json(std::string_view json, const context::Context& ctx);

}  // namespace flexscan::normalize

#endif  // FLEXSCAN_NORMALIZE_HPP
