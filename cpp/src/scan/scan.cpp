// ==============================================================================
// scan.cpp - MOD-0014: Конвейер сканирования подписок
// ==============================================================================
//
// MOD-0014 scan
// GUIDE-0001 G-011: консольный вывод только через output::Writer
//
// ==============================================================================

#include "flexscan/scan.hpp"

#include "flexscan/invoke.hpp"
#include "flexscan/json_extract.hpp"
#include "flexscan/output.hpp"
#include "flexscan/platform.hpp"
#include "flexscan/report.hpp"
#include "flexscan/runner.hpp"

namespace flexscan::scan {

Scanner::Scanner(const config::ScanConfig& config, runner::CommandRunner& runner,
                 output::Writer& writer)
    : config_(config), runner_(runner), writer_(writer) {}

void Scanner::skip(const context::Context& ctx, const ScanError& error) {
    writer_.warn("Skipping subscription " + context::describe(ctx) + " - " + error.format());
}

bool Scanner::scan_context(const context::Context& ctx, context::ContextSwitcher& switcher,
                           aggregate::Aggregator& aggregator) {
    writer_.info("Scanning subscription " + context::describe(ctx));

    auto switched = switcher.activate(ctx);
    if (!switched) {
        skip(ctx, switched.error);
        return false;
    }

    invoke::CommandInvoker invoker(runner_, config_);
    auto invoked = invoker.invoke(ctx);
    if (!invoked) {
        skip(ctx, invoked.error);
        return false;
    }

    auto json = io::extract_json(invoked.output);
    if (!json) {
        ScanError err;
        err.kind = ScanErrorKind::NoJsonFound;
        err.context_id = ctx.id;
        err.message = "command output contains no line starting with '{' or '['";
        skip(ctx, err);
        return false;
    }

    auto normalized = normalize::normalize_json(*json, ctx);
    if (!normalized) {
        skip(ctx, normalized.error);
        return false;
    }

    writer_.debug(std::to_string(normalized.records.size()) + " app(s) in " +
                  context::describe(ctx));
    aggregator.append(std::move(normalized.records));
    return true;
}

RunOutcome Scanner::run() {
    RunOutcome outcome;

    invoke::CommandInvoker(runner_, config_).prepare_tooling(writer_);

    context::ContextSwitcher switcher(runner_, config_);
    // До получения списка: ранний выход тоже проходит через восстановление
    context::ContextGuard guard(switcher, writer_);

    auto listed = switcher.list_contexts();
    if (!listed) {
        writer_.debug(listed.error);
    }
    if (listed.contexts.empty()) {
        writer_.warn("No enabled subscriptions found");
        guard.restore();
        return outcome;
    }

    outcome.contexts_total = listed.contexts.size();
    writer_.info("Found " + std::to_string(outcome.contexts_total) + " enabled subscription(s)");

    aggregate::Aggregator aggregator;
    for (const auto& ctx : listed.contexts) {
        if (!scan_context(ctx, switcher, aggregator)) {
            ++outcome.contexts_skipped;
        }
    }

    if (aggregator.empty()) {
        writer_.warn("No Function Apps found in any subscription");
        guard.restore();
        writer_.info("Done");
        return outcome;
    }

    outcome.summaries = aggregator.summarize();
    outcome.records = aggregator.records();

    report::export_full(outcome.records, config_.full_output);
    writer_.info("Wrote " + std::to_string(outcome.records.size()) + " record(s) to " +
                 platform::path_to_utf8(config_.full_output));
    report::export_summary(outcome.summaries, config_.summary_output);
    writer_.info("Wrote " + std::to_string(outcome.summaries.size()) + " summary row(s) to " +
                 platform::path_to_utf8(config_.summary_output));
    outcome.files_written = true;

    report::print_console_summary(outcome.summaries, outcome.records, writer_);

    guard.restore();
    writer_.info("Done");
    return outcome;
}

}  // namespace flexscan::scan
