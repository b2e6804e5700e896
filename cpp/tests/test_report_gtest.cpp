// ==============================================================================
// test_report_gtest.cpp - Тесты экспорта и консольной сводки (GoogleTest)
// ==============================================================================
//
// MOD-0013: report
// ADR-0003: RapidJSON для JSON сериализации
// ADR-0008: GoogleTest
//
// TST-REPORT-001..TST-REPORT-004
//
// ==============================================================================

#include "flexscan/report.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <stdexcept>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#else
#include <process.h>
#endif

namespace flexscan::report::test {

namespace fs = std::filesystem;
using flexscan::test::CapturedOutput;

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("flexscan_report_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      _getpid()
#else
                                      getpid()
#endif
                                  );
        temp_dir_ = fs::temp_directory_path() / unique_name;
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    static std::vector<normalize::EligibilityRecord> sample_records() {
        normalize::EligibilityRecord a;
        a.context_id = "sub-1";
        a.context_name = "Production";
        a.app_name = "fa1";
        a.resource_group = "rg1";
        a.eligibility = normalize::Eligibility::Eligible;

        normalize::EligibilityRecord b;
        b.context_id = "sub-1";
        b.context_name = "Production";
        b.app_name = "fa2";
        b.resource_group = "rg2";
        b.eligibility = normalize::Eligibility::Ineligible;
        b.reason = std::string("unsupported-runtime");
        return {a, b};
    }

    static std::vector<aggregate::ContextSummary> sample_summaries() {
        aggregate::ContextSummary s;
        s.context_id = "sub-1";
        s.context_name = "Production";
        s.total_apps = 2;
        s.eligible_apps = 1;
        s.ineligible_apps = 1;
        return {s};
    }

    fs::path temp_dir_;
};

// ==============================================================================
// TST-REPORT-001: JSON записей
// ==============================================================================

TEST_F(ReportTest, RenderRecords_KeysAndValues) {
    std::string text = render_records_json(sample_records());

    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 2u);

    const auto& first = doc[0];
    EXPECT_STREQ(first["context_id"].GetString(), "sub-1");
    EXPECT_STREQ(first["context_name"].GetString(), "Production");
    EXPECT_STREQ(first["app_name"].GetString(), "fa1");
    EXPECT_STREQ(first["resource_group"].GetString(), "rg1");
    EXPECT_STREQ(first["eligibility"].GetString(), "Eligible");
    ASSERT_TRUE(first.HasMember("reason"));
    EXPECT_TRUE(first["reason"].IsNull());

    const auto& second = doc[1];
    EXPECT_STREQ(second["eligibility"].GetString(), "Ineligible");
    EXPECT_STREQ(second["reason"].GetString(), "unsupported-runtime");
}

TEST_F(ReportTest, RenderRecords_PrettyWithTwoSpaceIndent) {
    std::string text = render_records_json(sample_records());
    EXPECT_EQ(text.rfind("[\n  {\n    \"context_id\"", 0), 0u);
    EXPECT_EQ(text.back(), '\n');
}

TEST_F(ReportTest, RenderRecords_Empty_IsEmptyArray) {
    rapidjson::Document doc;
    std::string text = render_records_json({});
    doc.Parse(text.c_str(), text.size());
    ASSERT_TRUE(doc.IsArray());
    EXPECT_EQ(doc.Size(), 0u);
}

// ==============================================================================
// TST-REPORT-002: JSON сводки
// ==============================================================================

TEST_F(ReportTest, RenderSummary_KeysAndCounts) {
    std::string text = render_summary_json(sample_summaries());

    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_EQ(doc.Size(), 1u);
    EXPECT_STREQ(doc[0]["context_id"].GetString(), "sub-1");
    EXPECT_STREQ(doc[0]["context_name"].GetString(), "Production");
    EXPECT_EQ(doc[0]["total_apps"].GetUint64(), 2u);
    EXPECT_EQ(doc[0]["eligible_apps"].GetUint64(), 1u);
    EXPECT_EQ(doc[0]["ineligible_apps"].GetUint64(), 1u);
}

// ==============================================================================
// TST-REPORT-003: Запись файлов
// ==============================================================================

TEST_F(ReportTest, ExportFull_WritesFile) {
    fs::path path = temp_dir_ / "all.json";
    export_full(sample_records(), path);

    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(read_file(path), render_records_json(sample_records()));
}

TEST_F(ReportTest, ExportSummary_OverwritesExisting) {
    fs::path path = temp_dir_ / "summary.json";
    {
        std::ofstream old(path);
        old << "stale content that is much longer than the new file should ever be ..........";
    }
    export_summary(sample_summaries(), path);

    EXPECT_EQ(read_file(path), render_summary_json(sample_summaries()));
}

TEST_F(ReportTest, ExportFull_UnwritablePath_Throws) {
    fs::path path = temp_dir_ / "missing-dir" / "all.json";
    EXPECT_THROW(export_full(sample_records(), path), std::runtime_error);
}

// ==============================================================================
// TST-REPORT-004: Консольная сводка
// ==============================================================================

TEST_F(ReportTest, ConsoleSummary_TableAndTotals) {
    CapturedOutput capture;
    {
        output::Writer writer(capture.config());
        print_console_summary(sample_summaries(), sample_records(), writer);
    }
    std::string out = capture.out();

    EXPECT_NE(out.find("Flex Consumption migration eligibility by subscription"), std::string::npos);
    EXPECT_NE(out.find("Subscription ID"), std::string::npos);
    EXPECT_NE(out.find("Production"), std::string::npos);
    EXPECT_NE(out.find("sub-1"), std::string::npos);
    EXPECT_NE(out.find("Subscriptions with apps: 1"), std::string::npos);
    EXPECT_NE(out.find("Total apps:              2"), std::string::npos);
    EXPECT_NE(out.find("Eligible:                1"), std::string::npos);
    EXPECT_NE(out.find("Ineligible:              1"), std::string::npos);
    EXPECT_TRUE(capture.err().empty());
}

}  // namespace flexscan::report::test
