// ==============================================================================
// test_context_gtest.cpp - Тесты переключения подписок (GoogleTest)
// ==============================================================================
//
// MOD-0009: context
// ADR-0008: GoogleTest
// ADR-0012: внешние вызовы через runner::CommandRunner
//
// TST-CONTEXT-001..TST-CONTEXT-005
//
// ==============================================================================

#include "flexscan/context.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace flexscan::context::test {

using flexscan::test::CapturedOutput;
using flexscan::test::count_occurrences;
using flexscan::test::FakeRunner;

class ContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_.subscriptions = {{"sub-1", "Production", "Enabled"},
                                 {"sub-2", "Staging", "Enabled"},
                                 {"sub-3", "Legacy", "Disabled"}};
        runner_.current = "sub-home";
        runner_.subscriptions.push_back({"sub-home", "Home", "Disabled"});
    }

    FakeRunner runner_;
    config::ScanConfig config_;
};

// ==============================================================================
// TST-CONTEXT-001: Разбор `az account list`
// ==============================================================================

TEST(ContextParseTest, ParseList_Basic) {
    auto result = parse_context_list(
        R"([{"id": "a", "name": "Alpha", "state": "Enabled"}, {"id": "b", "name": "Beta"}])");
    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.contexts.size(), 2u);
    EXPECT_EQ(result.contexts[0], (Context{"a", "Alpha"}));
    EXPECT_EQ(result.contexts[1], (Context{"b", "Beta"}));
}

TEST(ContextParseTest, ParseList_DisabledDropped) {
    auto result = parse_context_list(
        R"([{"id": "a", "name": "Alpha", "state": "Disabled"}, {"id": "b", "name": "Beta", "state": "Enabled"}])");
    ASSERT_TRUE(result);
    ASSERT_EQ(result.contexts.size(), 1u);
    EXPECT_EQ(result.contexts[0].id, "b");
}

TEST(ContextParseTest, ParseList_MissingName_DefaultsToId) {
    auto result = parse_context_list(R"([{"id": "a"}])");
    ASSERT_TRUE(result);
    ASSERT_EQ(result.contexts.size(), 1u);
    EXPECT_EQ(result.contexts[0].name, "a");
}

TEST(ContextParseTest, ParseList_EntriesWithoutId_Skipped) {
    auto result = parse_context_list(R"([{"name": "x"}, 5, {"id": "a", "name": "A"}])");
    ASSERT_TRUE(result);
    ASSERT_EQ(result.contexts.size(), 1u);
    EXPECT_EQ(result.contexts[0].id, "a");
}

TEST(ContextParseTest, ParseList_Preamble_Skipped) {
    auto result = parse_context_list("WARNING: preview\n[{\"id\": \"a\"}]");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.contexts.size(), 1u);
}

TEST(ContextParseTest, ParseList_EmptyArray_OkAndEmpty) {
    auto result = parse_context_list("[]");
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.contexts.empty());
}

TEST(ContextParseTest, ParseList_NoJson_Error) {
    auto result = parse_context_list("Please run 'az login'");
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.error.empty());
}

TEST(ContextParseTest, ParseList_ObjectRoot_Error) {
    auto result = parse_context_list(R"({"id": "a"})");
    EXPECT_FALSE(result);
}

// ==============================================================================
// TST-CONTEXT-002: Разбор `az account show`
// ==============================================================================

TEST(ContextParseTest, ParseCurrent_Basic) {
    auto ctx = parse_current_context(R"({"id": "a", "name": "Alpha"})");
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(*ctx, (Context{"a", "Alpha"}));
}

TEST(ContextParseTest, ParseCurrent_Invalid_Nullopt) {
    EXPECT_FALSE(parse_current_context("").has_value());
    EXPECT_FALSE(parse_current_context("[]").has_value());
    EXPECT_FALSE(parse_current_context(R"({"name": "x"})").has_value());
}

TEST(ContextParseTest, Describe_NameAndId) {
    EXPECT_EQ(describe(Context{"a", "Alpha"}), "Alpha (a)");
    EXPECT_EQ(describe(Context{"a", "a"}), "a");
    EXPECT_EQ(describe(Context{"a", ""}), "a");
}

// ==============================================================================
// TST-CONTEXT-003: ContextSwitcher
// ==============================================================================

TEST_F(ContextTest, ListContexts_OnlyEnabled) {
    ContextSwitcher switcher(runner_, config_);
    auto result = switcher.list_contexts();

    ASSERT_TRUE(result);
    ASSERT_EQ(result.contexts.size(), 2u);
    EXPECT_EQ(result.contexts[0].id, "sub-1");
    EXPECT_EQ(result.contexts[1].id, "sub-2");
}

TEST_F(ContextTest, ListContexts_CommandFailure_Error) {
    runner_.list_override = FakeRunner::fail("ERROR: Please run 'az login'");
    ContextSwitcher switcher(runner_, config_);

    auto result = switcher.list_contexts();

    EXPECT_FALSE(result);
    EXPECT_TRUE(result.contexts.empty());
    EXPECT_NE(result.error.find("az account list failed"), std::string::npos);
    EXPECT_NE(result.error.find("az login"), std::string::npos);
}

TEST_F(ContextTest, Activate_ChangesAmbientSubscription) {
    ContextSwitcher switcher(runner_, config_);

    auto result = switcher.activate(Context{"sub-2", "Staging"});

    ASSERT_TRUE(result);
    EXPECT_EQ(runner_.current, std::optional<std::string>("sub-2"));
}

TEST_F(ContextTest, Activate_Failure_SwitchFailed) {
    runner_.set_failures.insert("sub-1");
    ContextSwitcher switcher(runner_, config_);

    auto result = switcher.activate(Context{"sub-1", "Production"});

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ScanErrorKind::SwitchFailed);
    EXPECT_EQ(result.error.context_id, "sub-1");
    EXPECT_EQ(runner_.current, std::optional<std::string>("sub-home"));
}

TEST_F(ContextTest, Commands_UseConfiguredExecutable) {
    config_.az_path = "/opt/az/bin/az";
    ContextSwitcher switcher(runner_, config_);

    EXPECT_EQ(switcher.list_command().front(), "/opt/az/bin/az");
    EXPECT_EQ(switcher.set_command("x"),
              (std::vector<std::string>{"/opt/az/bin/az", "account", "set", "--subscription", "x",
                                        "--only-show-errors"}));
}

TEST_F(ContextTest, CaptureOriginal_NotLoggedIn_Nullopt) {
    runner_.current.reset();
    ContextSwitcher switcher(runner_, config_);
    EXPECT_FALSE(switcher.capture_original().has_value());
}

// ==============================================================================
// TST-CONTEXT-004: ContextGuard восстанавливает ровно один раз
// ==============================================================================

TEST_F(ContextTest, Guard_RestoresOnScopeExit) {
    CapturedOutput capture;
    output::Writer writer(capture.config());
    ContextSwitcher switcher(runner_, config_);
    {
        ContextGuard guard(switcher, writer);
        ASSERT_TRUE(guard.original().has_value());
        EXPECT_EQ(guard.original()->id, "sub-home");
        ASSERT_TRUE(switcher.activate(Context{"sub-1", "Production"}));
    }
    EXPECT_EQ(runner_.current, std::optional<std::string>("sub-home"));
    ASSERT_FALSE(runner_.set_history.empty());
    EXPECT_EQ(runner_.set_history.back(), "sub-home");
}

TEST_F(ContextTest, Guard_ExplicitRestore_NotRepeatedByDestructor) {
    CapturedOutput capture;
    output::Writer writer(capture.config());
    ContextSwitcher switcher(runner_, config_);
    {
        ContextGuard guard(switcher, writer);
        ASSERT_TRUE(switcher.activate(Context{"sub-2", "Staging"}));
        guard.restore();
        guard.restore();
        EXPECT_TRUE(guard.restored());
    }
    ASSERT_EQ(runner_.set_history.size(), 2u);
    EXPECT_EQ(runner_.set_history[0], "sub-2");
    EXPECT_EQ(runner_.set_history[1], "sub-home");
}

TEST_F(ContextTest, Guard_RestoresWhenExceptionPropagates) {
    CapturedOutput capture;
    output::Writer writer(capture.config());
    ContextSwitcher switcher(runner_, config_);

    EXPECT_THROW(
        {
            ContextGuard guard(switcher, writer);
            EXPECT_TRUE(switcher.activate(Context{"sub-1", "Production"}));
            throw std::runtime_error("export failed");
        },
        std::runtime_error);

    EXPECT_EQ(runner_.current, std::optional<std::string>("sub-home"));
    EXPECT_EQ(runner_.count_calls("set"), 2u);
}

TEST_F(ContextTest, Guard_NoOriginal_NoRestore) {
    runner_.current.reset();
    CapturedOutput capture;
    output::Writer writer(capture.config());
    ContextSwitcher switcher(runner_, config_);
    {
        ContextGuard guard(switcher, writer);
        EXPECT_FALSE(guard.original().has_value());
        ASSERT_TRUE(switcher.activate(Context{"sub-1", "Production"}));
    }
    EXPECT_EQ(runner_.set_history.size(), 1u);
}

// ==============================================================================
// TST-CONTEXT-005: Неудачное восстановление -> предупреждение
// ==============================================================================

TEST_F(ContextTest, Guard_RestoreFailure_Warns) {
    runner_.set_failures.insert("sub-home");
    CapturedOutput capture;
    {
        output::Writer writer(capture.config());
        ContextSwitcher switcher(runner_, config_);
        ContextGuard guard(switcher, writer);
        guard.restore();
        EXPECT_TRUE(guard.restored());
    }
    EXPECT_EQ(count_occurrences(capture.err(), "[!]"), 1u);
    EXPECT_NE(capture.err().find("[!] Could not restore the original subscription Home (sub-home)"),
              std::string::npos);
}

TEST_F(ContextTest, Guard_NonStdException_LoggedAsError) {
    runner_.set_throws.insert("sub-home");
    CapturedOutput capture;
    {
        output::Writer writer(capture.config());
        ContextSwitcher switcher(runner_, config_);
        ContextGuard guard(switcher, writer);
        ASSERT_TRUE(switcher.activate(Context{"sub-1", "Production"}));
    }
    EXPECT_EQ(runner_.set_history.back(), "sub-home");
    EXPECT_NE(capture.err().find("[x] failed to restore the original subscription: unknown error"),
              std::string::npos);
}

}  // namespace flexscan::context::test
