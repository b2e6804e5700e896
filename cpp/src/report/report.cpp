// ==============================================================================
// report.cpp - MOD-0013: Экспорт результатов и консольная сводка
// ==============================================================================
//
// MOD-0013 report
// ADR-0003: RapidJSON для JSON сериализации
// GUIDE-0001 G-011: консольный вывод только через output::Writer
//
// ==============================================================================

#include "flexscan/report.hpp"

#include "flexscan/output.hpp"
#include "flexscan/platform.hpp"

#include <cstdint>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <stdexcept>

namespace flexscan::report {

namespace {

rapidjson::Value make_string(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

std::string to_pretty(const rapidjson::Document& doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
    std::string text(buffer.GetString(), buffer.GetSize());
    text += '\n';
    return text;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open '" + platform::path_to_utf8(path) + "' for writing");
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        throw std::runtime_error("failed to write '" + platform::path_to_utf8(path) + "'");
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

std::string render_records_json(const std::vector<normalize::EligibilityRecord>& records) {
    rapidjson::Document doc(rapidjson::kArrayType);
    auto& alloc = doc.GetAllocator();

    for (const auto& rec : records) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("context_id", make_string(rec.context_id, alloc), alloc);
        obj.AddMember("context_name", make_string(rec.context_name, alloc), alloc);
        obj.AddMember("app_name", make_string(rec.app_name, alloc), alloc);
        obj.AddMember("resource_group", make_string(rec.resource_group, alloc), alloc);
        obj.AddMember("eligibility",
                      rapidjson::Value(normalize::eligibility_to_string(rec.eligibility), alloc),
                      alloc);
        if (rec.reason.has_value()) {
            obj.AddMember("reason", make_string(*rec.reason, alloc), alloc);
        } else {
            obj.AddMember("reason", rapidjson::Value(rapidjson::kNullType), alloc);
        }
        doc.PushBack(obj, alloc);
    }
    return to_pretty(doc);
}

std::string render_summary_json(const std::vector<aggregate::ContextSummary>& summaries) {
    rapidjson::Document doc(rapidjson::kArrayType);
    auto& alloc = doc.GetAllocator();

    for (const auto& s : summaries) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("context_id", make_string(s.context_id, alloc), alloc);
        obj.AddMember("context_name", make_string(s.context_name, alloc), alloc);
        obj.AddMember("total_apps", static_cast<std::uint64_t>(s.total_apps), alloc);
        obj.AddMember("eligible_apps", static_cast<std::uint64_t>(s.eligible_apps), alloc);
        obj.AddMember("ineligible_apps", static_cast<std::uint64_t>(s.ineligible_apps), alloc);
        doc.PushBack(obj, alloc);
    }
    return to_pretty(doc);
}

void export_full(const std::vector<normalize::EligibilityRecord>& records,
                 const std::filesystem::path& path) {
    write_file(path, render_records_json(records));
}

void export_summary(const std::vector<aggregate::ContextSummary>& summaries,
                    const std::filesystem::path& path) {
    write_file(path, render_summary_json(summaries));
}

// ----------------------------------------------------------------------------
// Консоль
// ----------------------------------------------------------------------------

void print_console_summary(const std::vector<aggregate::ContextSummary>& summaries,
                           const std::vector<normalize::EligibilityRecord>& records,
                           output::Writer& writer) {
    output::Table table;
    table.set_headers({"Subscription", "Subscription ID", "Total", "Eligible", "Ineligible"});
    table.set_alignment(2, output::Align::Right);
    table.set_alignment(3, output::Align::Right);
    table.set_alignment(4, output::Align::Right);

    for (const auto& s : summaries) {
        table.add_row({s.context_name, s.context_id, std::to_string(s.total_apps),
                       std::to_string(s.eligible_apps), std::to_string(s.ineligible_apps)});
    }

    size_t eligible = 0;
    for (const auto& rec : records) {
        if (rec.eligibility == normalize::Eligibility::Eligible) {
            ++eligible;
        }
    }

    const auto totals = aggregate::compute_totals(summaries);

    writer.green_line("Flex Consumption migration eligibility by subscription");
    table.print(writer);
    writer.write_line(output::Stream::Stdout, "");
    writer.write_line(output::Stream::Stdout,
                      "Subscriptions with apps: " + std::to_string(totals.contexts_with_apps));
    writer.write_line(output::Stream::Stdout, "Total apps:              " +
                                                  std::to_string(records.size()));
    writer.write_line(output::Stream::Stdout,
                      "Eligible:                " + std::to_string(eligible));
    writer.write_line(output::Stream::Stdout,
                      "Ineligible:              " + std::to_string(records.size() - eligible));
}

}  // namespace flexscan::report
