// ==============================================================================
// normalize.cpp - MOD-0011: Нормализация отчёта о миграции
// ==============================================================================
//
// MOD-0011 normalize
// ADR-0003: RapidJSON
//
// ==============================================================================

#include "flexscan/normalize.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace flexscan::normalize {

namespace {

constexpr const char* ELIGIBLE_FIELD = "eligible_apps";
constexpr const char* INELIGIBLE_FIELD = "ineligible_apps";

/// Текст значения: строка как есть, null/нет -> nullopt, прочее -> компактный JSON
std::optional<std::string> value_text(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return std::nullopt;
    }
    if (it->value.IsString()) {
        return std::string(it->value.GetString(), it->value.GetStringLength());
    }
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    it->value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

ScanError malformed(std::string message) {
    ScanError err;
    err.kind = ScanErrorKind::MalformedPayload;
    err.message = std::move(message);
    return err;
}

/// Прочитать один список приложений
/// @return false и error при неверной форме
bool read_apps(const rapidjson::Value& root, const char* field, bool with_reason,
               std::vector<AppEntry>& out, ScanError& error) {
    auto it = root.FindMember(field);
    if (it == root.MemberEnd() || it->value.IsNull()) {
        return true;
    }
    if (!it->value.IsArray()) {
        error = malformed(std::string("'") + field + "' is not an array");
        return false;
    }

    size_t index = 0;
    for (const auto& item : it->value.GetArray()) {
        if (!item.IsObject()) {
            error = malformed(std::string("'") + field + "[" + std::to_string(index) +
                              "]' is not an object");
            return false;
        }
        AppEntry entry;
        entry.name = value_text(item, "name").value_or("");
        entry.resource_group = value_text(item, "resource_group").value_or("");
        if (with_reason) {
            entry.reason = value_text(item, "reason");
        }
        out.push_back(std::move(entry));
        ++index;
    }
    return true;
}

}  // anonymous namespace

const char* eligibility_to_string(Eligibility e) {
    return e == Eligibility::Eligible ? "Eligible" : "Ineligible";
}

PayloadResult parse_payload(std::string_view json) {
    PayloadResult result;

    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        result.error = malformed(std::string("JSON parse error: ") +
                                 rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " +
                                 std::to_string(doc.GetErrorOffset()));
        return result;
    }
    if (!doc.IsObject()) {
        result.error = malformed("expected a JSON object at the top level");
        return result;
    }

    if (!read_apps(doc, ELIGIBLE_FIELD, false, result.payload.eligible_apps, result.error) ||
        !read_apps(doc, INELIGIBLE_FIELD, true, result.payload.ineligible_apps, result.error)) {
        return result;
    }

    result.ok = true;
    return result;
}

std::vector<EligibilityRecord> normalize(const ValidatedPayload& payload,
                                         const context::Context& ctx) {
    std::vector<EligibilityRecord> records;
    records.reserve(payload.eligible_apps.size() + payload.ineligible_apps.size());

    for (const auto& app : payload.eligible_apps) {
        EligibilityRecord rec;
        rec.context_id = ctx.id;
        rec.context_name = ctx.name;
        rec.app_name = app.name;
        rec.resource_group = app.resource_group;
        rec.eligibility = Eligibility::Eligible;
        records.push_back(std::move(rec));
    }

    for (const auto& app : payload.ineligible_apps) {
        EligibilityRecord rec;
        rec.context_id = ctx.id;
        rec.context_name = ctx.name;
        rec.app_name = app.name;
        rec.resource_group = app.resource_group;
        rec.eligibility = Eligibility::Ineligible;
        rec.reason = app.reason;
        records.push_back(std::move(rec));
    }

    return records;
}

NormalizeResult normalize_json(std::string_view json, const context::Context& ctx) {
    NormalizeResult result;
    auto parsed = parse_payload(json);
    if (!parsed) {
        result.error = parsed.error;
        result.error.context_id = ctx.id;
        return result;
    }
    result.records = normalize(parsed.payload, ctx);
    result.ok = true;
    return result;
}

}  // namespace flexscan::normalize
