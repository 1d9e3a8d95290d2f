#include <allocsim/io/report_sinks.hpp>

#include <allocsim/algo/allocation_engine.hpp>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace allocsim::io;
using namespace allocsim::core;

class ReportSinksTest : public ::testing::Test {
protected:
    void run_with(ReportSink& sink) {
        allocsim::algo::AllocationEngine engine;
        engine.set_report_sink(&sink);
        (void)engine.run(supply_, orders_);
    }

    static std::size_t count_lines(const std::string& text) {
        std::size_t lines = 0;
        for (char c : text) {
            lines += c == '\n' ? 1 : 0;
        }
        return lines;
    }

    std::vector<SupplyRecord> supply_{{202601, 100, 100}, {202602, 50, 60}};
    std::vector<DemandOrder> orders_{
        DemandOrder("O1", "Microsoft", "Data Center", PriorityTier::P1, 202601, 50),
        DemandOrder("O2", "Meta", "Data Center", PriorityTier::P1, 202601, 30),
        DemandOrder("O3", "Tesla", "Automotive", PriorityTier::P2, 202601, 40),
    };
};

// =============================================================================
// NullReportSink
// =============================================================================

TEST_F(ReportSinksTest, NullSinkAcceptsAllCalls) {
    NullReportSink sink;
    EXPECT_NO_THROW(run_with(sink));
}

// =============================================================================
// MemoryReportSink
// =============================================================================

TEST_F(ReportSinksTest, MemorySinkBuffersEverything) {
    MemoryReportSink sink;
    run_with(sink);

    EXPECT_EQ(sink.periods(), (std::vector<Period>{202601, 202602}));
    EXPECT_EQ(sink.results().size(), 4u);
    ASSERT_EQ(sink.summaries().size(), 2u);
    EXPECT_EQ(sink.summaries()[0].total_allocated, 100u);
    EXPECT_EQ(sink.open_periods(), 0u);

    sink.clear();
    EXPECT_TRUE(sink.results().empty());
    EXPECT_TRUE(sink.periods().empty());
}

// =============================================================================
// JsonReportSink
// =============================================================================

TEST_F(ReportSinksTest, JsonSinkEmptyDocument) {
    std::ostringstream oss;
    {
        JsonReportSink sink(oss);
        // Let destructor call finalize
    }
    EXPECT_EQ(oss.str(), "{\"periods\":[]}\n");
}

TEST_F(ReportSinksTest, JsonSinkWritesOneDocument) {
    std::ostringstream oss;
    {
        JsonReportSink sink(oss);
        run_with(sink);
        sink.finalize();
        sink.finalize();
    }

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc["periods"].IsArray());
    ASSERT_EQ(doc["periods"].Size(), 2u);

    const auto& first = doc["periods"][0];
    EXPECT_EQ(first["period"].GetInt64(), 202601);
    EXPECT_STREQ(first["label"].GetString(), "2026-W01");
    EXPECT_EQ(first["global_limit"].GetUint64(), 100u);
    EXPECT_EQ(first["total_demand"].GetUint64(), 120u);
    EXPECT_STREQ(first["constraining_input"].GetString(), "A");
    ASSERT_EQ(first["orders"].Size(), 3u);
    EXPECT_STREQ(first["orders"][2]["order_id"].GetString(), "O3");
    EXPECT_STREQ(first["orders"][2]["status"].GetString(), "Partial");
    EXPECT_EQ(first["tiers"].Size(), TIER_COUNT);
    EXPECT_STREQ(first["tiers"][1]["tier"].GetString(), "P2");
    EXPECT_EQ(first["tiers"][1]["allocated"].GetUint64(), 20u);
}

// =============================================================================
// CsvReportSink
// =============================================================================

TEST_F(ReportSinksTest, CsvSinkWritesRowsAndSummary) {
    std::ostringstream results;
    std::ostringstream summary;
    CsvReportSink sink(results, &summary);
    run_with(sink);

    std::string text = results.str();
    EXPECT_EQ(text.rfind("period,order_id,customer_id,segment,priority_tier,period_requested,"
                         "qty_ordered,qty_allocated,qty_allocated_this_period,status\n", 0), 0u);
    EXPECT_EQ(count_lines(text), 5u);
    EXPECT_NE(text.find("2026-W01,O3,Tesla,Automotive,P2,2026-W01,40,20,20,Partial\n"),
              std::string::npos);
    EXPECT_NE(text.find("2026-W02,O3,Tesla,Automotive,P2,2026-W01,40,40,20,Full\n"),
              std::string::npos);

    std::string sums = summary.str();
    EXPECT_EQ(count_lines(sums), 3u);
    EXPECT_NE(sums.find("2026-W01,100,0,100,120,100,A,80,20,0,0,0,0,0,0,0\n"), std::string::npos);
}

TEST_F(ReportSinksTest, CsvSinkWithoutSummaryStream) {
    std::ostringstream results;
    CsvReportSink sink(results);
    EXPECT_NO_THROW(run_with(sink));
    EXPECT_EQ(count_lines(results.str()), 5u);
}

// =============================================================================
// TextualReportSink
// =============================================================================

TEST_F(ReportSinksTest, TextualSinkPrintsPeriods) {
    std::ostringstream oss;
    TextualReportSink sink(oss);
    run_with(sink);

    std::string text = oss.str();
    EXPECT_NE(text.find("=== 2026-W01 ==="), std::string::npos);
    EXPECT_NE(text.find("=== 2026-W02 ==="), std::string::npos);
    EXPECT_NE(text.find("Tesla"), std::string::npos);
    EXPECT_NE(text.find("limit 100"), std::string::npos);
    EXPECT_NE(text.find("P2=20/40"), std::string::npos);
}
