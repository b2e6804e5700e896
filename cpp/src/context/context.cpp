// ==============================================================================
// context.cpp - MOD-0009: Подписки и активная подписка Azure CLI
// ==============================================================================
//
// MOD-0009 context
// ADR-0003: RapidJSON для разбора вывода az
//
// ==============================================================================

#include "flexscan/context.hpp"

#include "flexscan/json_extract.hpp"
#include "flexscan/output.hpp"
#include "flexscan/runner.hpp"

#include <exception>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace flexscan::context {

namespace {

constexpr const char* LIST_QUERY = "[?state=='Enabled'].{id:id, name:name, state:state}";
constexpr const char* SHOW_QUERY = "{id:id, name:name}";

std::string string_member(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return {};
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

}  // anonymous namespace

std::string describe(const Context& ctx) {
    if (ctx.name.empty() || ctx.name == ctx.id) {
        return ctx.id;
    }
    return ctx.name + " (" + ctx.id + ")";
}

// ----------------------------------------------------------------------------
// Разбор вывода az
// ----------------------------------------------------------------------------

ContextListResult parse_context_list(std::string_view output) {
    ContextListResult result;

    auto json = io::extract_json(output);
    if (!json) {
        result.error = "subscription list contains no JSON";
        return result;
    }

    rapidjson::Document doc;
    doc.Parse(json->c_str(), json->size());
    if (doc.HasParseError()) {
        result.error = std::string("subscription list: JSON parse error: ") +
                       rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " +
                       std::to_string(doc.GetErrorOffset());
        return result;
    }
    if (!doc.IsArray()) {
        result.error = "subscription list: expected a JSON array";
        return result;
    }

    for (const auto& item : doc.GetArray()) {
        if (!item.IsObject()) {
            continue;
        }
        Context ctx;
        ctx.id = string_member(item, "id");
        if (ctx.id.empty()) {
            continue;
        }
        auto state = item.FindMember("state");
        if (state != item.MemberEnd() && state->value.IsString() &&
            std::string_view(state->value.GetString()) != "Enabled") {
            continue;
        }
        ctx.name = string_member(item, "name");
        if (ctx.name.empty()) {
            ctx.name = ctx.id;
        }
        result.contexts.push_back(std::move(ctx));
    }

    result.ok = true;
    return result;
}

std::optional<Context> parse_current_context(std::string_view output) {
    auto json = io::extract_json(output);
    if (!json) {
        return std::nullopt;
    }

    rapidjson::Document doc;
    doc.Parse(json->c_str(), json->size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }

    Context ctx;
    ctx.id = string_member(doc, "id");
    if (ctx.id.empty()) {
        return std::nullopt;
    }
    ctx.name = string_member(doc, "name");
    if (ctx.name.empty()) {
        ctx.name = ctx.id;
    }
    return ctx;
}

// ----------------------------------------------------------------------------
// ContextSwitcher
// ----------------------------------------------------------------------------

ContextSwitcher::ContextSwitcher(runner::CommandRunner& runner, const config::ScanConfig& config)
    : runner_(runner), config_(config) {}

std::vector<std::string> ContextSwitcher::list_command() const {
    return {config_.az_path, "account", "list", "--query", LIST_QUERY,
            "--output", "json", "--only-show-errors"};
}

std::vector<std::string> ContextSwitcher::show_command() const {
    return {config_.az_path, "account", "show", "--query", SHOW_QUERY,
            "--output", "json", "--only-show-errors"};
}

std::vector<std::string> ContextSwitcher::set_command(const std::string& id) const {
    return {config_.az_path, "account", "set", "--subscription", id, "--only-show-errors"};
}

ContextListResult ContextSwitcher::list_contexts() {
    auto proc = runner_.run(list_command(), config_.timeout());
    if (!proc.succeeded()) {
        ContextListResult result;
        result.error = "az account list failed: " + runner::describe_failure(proc, config_.timeout());
        return result;
    }
    return parse_context_list(proc.out);
}

std::optional<Context> ContextSwitcher::capture_original() {
    auto proc = runner_.run(show_command(), config_.timeout());
    if (!proc.succeeded()) {
        return std::nullopt;
    }
    return parse_current_context(proc.out);
}

SwitchResult ContextSwitcher::activate(const Context& ctx) {
    SwitchResult result;
    auto proc = runner_.run(set_command(ctx.id), config_.timeout());
    if (!proc.succeeded()) {
        result.error.kind = ScanErrorKind::SwitchFailed;
        result.error.context_id = ctx.id;
        result.error.message = runner::describe_failure(proc, config_.timeout());
        return result;
    }
    result.ok = true;
    return result;
}

SwitchResult ContextSwitcher::restore(const std::optional<Context>& original) {
    if (!original.has_value()) {
        SwitchResult result;
        result.ok = true;
        return result;
    }
    return activate(*original);
}

// ----------------------------------------------------------------------------
// ContextGuard
// ----------------------------------------------------------------------------

ContextGuard::ContextGuard(ContextSwitcher& switcher, output::Writer& writer)
    : switcher_(switcher), writer_(writer), original_(switcher.capture_original()) {
    if (original_.has_value()) {
        writer_.debug("Current subscription: " + describe(*original_));
    } else {
        writer_.debug("No current subscription, nothing to restore after the scan");
    }
}

ContextGuard::~ContextGuard() {
    try {
        restore();
    } catch (const std::exception& e) {
        writer_.error(std::string("failed to restore the original subscription: ") + e.what());
    } catch (...) {
        writer_.error("failed to restore the original subscription: unknown error");
    }
}

void ContextGuard::restore() {
    if (restored_) {
        return;
    }
    restored_ = true;

    if (!original_.has_value()) {
        return;
    }
    auto result = switcher_.restore(original_);
    if (!result) {
        writer_.warn("Could not restore the original subscription " + describe(*original_) +
                     " - " + result.error.message);
        return;
    }
    writer_.debug("Restored subscription " + describe(*original_));
}

}  // namespace flexscan::context
