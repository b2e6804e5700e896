// ==============================================================================
// invoke.cpp - MOD-0010: Команда листинга миграции Flex Consumption
// ==============================================================================

#include "flexscan/invoke.hpp"

#include "flexscan/output.hpp"
#include "flexscan/runner.hpp"

namespace flexscan::invoke {

CommandInvoker::CommandInvoker(runner::CommandRunner& runner, const config::ScanConfig& config)
    : runner_(runner), config_(config) {}

std::vector<std::string> CommandInvoker::listing_command(const context::Context& ctx) const {
    std::vector<std::string> argv = {config_.az_path, "functionapp", "flex-migration", "list",
                                     "--output", "json", "--only-show-errors"};
    if (config_.scope_per_call) {
        argv.push_back("--subscription");
        argv.push_back(ctx.id);
    }
    return argv;
}

std::vector<std::string> CommandInvoker::extension_command(const std::string& extension) const {
    return {config_.az_path, "extension", "add", "--upgrade", "--name", extension,
            "--only-show-errors"};
}

InvokeResult CommandInvoker::invoke(const context::Context& ctx) {
    InvokeResult result;
    auto proc = runner_.run(listing_command(ctx), config_.timeout());
    if (!proc.succeeded()) {
        result.error.kind = ScanErrorKind::InvocationFailed;
        result.error.context_id = ctx.id;
        result.error.message = runner::describe_failure(proc, config_.timeout());
        return result;
    }
    result.ok = true;
    result.output = std::move(proc.out);
    return result;
}

size_t CommandInvoker::prepare_tooling(output::Writer& writer) {
    if (config_.skip_install) {
        writer.debug("Skipping Azure CLI extension install/update");
        return 0;
    }

    size_t failures = 0;
    for (const auto& ext : config_.extensions) {
        writer.info("Installing or updating Azure CLI extension '" + ext + "'");
        auto proc = runner_.run(extension_command(ext), config_.timeout());
        if (!proc.succeeded()) {
            ++failures;
            writer.warn("Extension '" + ext + "' could not be installed or updated - " +
                        runner::describe_failure(proc, config_.timeout()));
        }
    }
    return failures;
}

}  // namespace flexscan::invoke
