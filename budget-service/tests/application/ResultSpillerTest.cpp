#include <gtest/gtest.h>

#include "application/ResultSpiller.hpp"
#include "domain/Errors.hpp"
#include "mocks/InMemorySpillStorage.hpp"
#include <nlohmann/json.hpp>

using namespace budget;
using namespace budget::application;
using budget::tests::InMemorySpillStorage;
using budget::tests::MockOutputSettings;
using nlohmann::ordered_json;

// ============================================================================
// Test Fixture
// ============================================================================

class ResultSpillerTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<InMemorySpillStorage>();
        settings_ = std::make_shared<MockOutputSettings>("/data/out");
        spiller_ = std::make_unique<ResultSpiller>(storage_, settings_);
    }

    domain::TransactionSummary smallSummary() {
        domain::TransactionSummary summary;
        summary.totalMilliunits = -12340;
        summary.items = ordered_json::parse(R"([
            {"id": "t1", "amount": "-$10.00", "amount_milliunits": -10000},
            {"id": "t2", "amount": "-$2.34", "amount_milliunits": -2340}
        ])");
        return summary;
    }

    domain::TransactionSummary largeSummary() {
        domain::TransactionSummary summary;
        for (int i = 0; i < 300; ++i) {
            ordered_json txn;
            txn["id"] = "txn-" + std::to_string(i);
            txn["memo"] = std::string(100, 'x');
            summary.items.push_back(txn);
        }
        return summary;
    }

    // Одна транзакция, memo подобран так, чтобы документ занял ровно length символов
    static domain::TransactionSummary summaryOfLength(size_t length) {
        domain::TransactionSummary summary;
        ordered_json txn;
        txn["id"] = "t1";
        txn["memo"] = "";
        summary.items.push_back(txn);

        auto base = ResultSpiller::characterCount(summary.document().dump(2));
        summary.items[0]["memo"] = std::string(length - base, 'x');
        return summary;
    }

    std::shared_ptr<InMemorySpillStorage> storage_;
    std::shared_ptr<MockOutputSettings> settings_;
    std::unique_ptr<ResultSpiller> spiller_;
};

// ============================================================================
// ТЕСТЫ: вывод в файл
// ============================================================================

TEST_F(ResultSpillerTest, OutputToFile_ExplicitPath) {
    domain::OutputOptions options;
    options.outputPath = "/data/custom/result.json";

    auto ack = ordered_json::parse(spiller_->deliver(smallSummary(), options, "transactions"));

    EXPECT_EQ(ack["count"], 2);
    EXPECT_EQ(ack["total_milliunits"], -12340);
    EXPECT_EQ(ack["total"], "-$12.34");
    EXPECT_EQ(ack["output_file"], "/data/custom/result.json");
    EXPECT_EQ(ack["message"], "Wrote 2 transactions to /data/custom/result.json");
    EXPECT_FALSE(ack.contains("transactions"));

    ASSERT_EQ(storage_->files().count("/data/custom/result.json"), 1u);
    auto written = ordered_json::parse(storage_->files().at("/data/custom/result.json"));
    EXPECT_EQ(written["count"], 2);
    EXPECT_EQ(written["transactions"].size(), 2u);
}

TEST_F(ResultSpillerTest, OutputToFile_DefaultPathUsesPrefixAndStamp) {
    domain::OutputOptions options;

    auto ack = ordered_json::parse(spiller_->deliver(smallSummary(), options, "transactions"));

    std::string path = ack["output_file"];
    EXPECT_EQ(path.rfind("/data/out/transactions_", 0), 0u);
    EXPECT_EQ(path.size(), std::string("/data/out/transactions_YYYYmmdd_HHMMSS.json").size());
    EXPECT_EQ(path.substr(path.size() - 5), ".json");
    EXPECT_EQ(storage_->writeCount(), 1);
}

TEST_F(ResultSpillerTest, OutputToFile_SearchMessage) {
    auto summary = smallSummary();
    summary.query = "coffee";
    domain::OutputOptions options;
    options.outputPath = "/data/search.json";

    auto ack = ordered_json::parse(spiller_->deliver(summary, options, "search_transactions"));

    EXPECT_EQ(ack["query"], "coffee");
    EXPECT_EQ(ack["message"], "Found 2 matching transactions. Wrote to /data/search.json");
}

TEST_F(ResultSpillerTest, OutputToFile_EmptyPathFallsBackToDefault) {
    domain::OutputOptions options;
    options.outputPath = "";

    auto ack = ordered_json::parse(spiller_->deliver(smallSummary(), options, "transactions"));

    std::string path = ack["output_file"];
    EXPECT_EQ(path.rfind("/data/out/transactions_", 0), 0u);
}

// ============================================================================
// ТЕСТЫ: ответ целиком
// ============================================================================

TEST_F(ResultSpillerTest, Inline_UnderLimit_ReturnsDocument) {
    domain::OutputOptions options;
    options.outputToFile = false;

    auto text = spiller_->deliver(smallSummary(), options, "transactions");
    auto document = ordered_json::parse(text);

    EXPECT_EQ(document["count"], 2);
    EXPECT_EQ(document["total"], "-$12.34");
    EXPECT_EQ(document["transactions"][1]["id"], "t2");
    EXPECT_EQ(storage_->writeCount(), 0);
}

TEST_F(ResultSpillerTest, Inline_OverLimit_Spills) {
    domain::OutputOptions options;
    options.outputToFile = false;
    options.outputPath = "/data/big.json";

    auto ack = ordered_json::parse(spiller_->deliver(largeSummary(), options, "transactions"));

    std::string message = ack["message"];
    EXPECT_EQ(message.rfind("Response too large (", 0), 0u);
    EXPECT_NE(message.find(" chars). Wrote to /data/big.json"), std::string::npos);
    EXPECT_EQ(ack["count"], 300);
    EXPECT_EQ(ack["output_file"], "/data/big.json");
    EXPECT_EQ(storage_->writeCount(), 1);

    auto written = ordered_json::parse(storage_->files().at("/data/big.json"));
    EXPECT_EQ(written["count"], 300);
    ASSERT_EQ(written["transactions"].size(), 300u);
    EXPECT_EQ(written["transactions"][299]["id"], "txn-299");
}

TEST_F(ResultSpillerTest, Inline_ExactlyAtLimit_StaysInline) {
    domain::OutputOptions options;
    options.outputToFile = false;
    options.outputPath = "/data/edge.json";

    auto atLimit = summaryOfLength(ResultSpiller::CHARACTER_LIMIT);
    auto text = spiller_->deliver(atLimit, options, "transactions");

    EXPECT_EQ(ResultSpiller::characterCount(text), ResultSpiller::CHARACTER_LIMIT);
    EXPECT_EQ(ordered_json::parse(text)["count"], 1);
    EXPECT_EQ(storage_->writeCount(), 0);

    auto overLimit = summaryOfLength(ResultSpiller::CHARACTER_LIMIT + 1);
    auto ack = ordered_json::parse(spiller_->deliver(overLimit, options, "transactions"));

    EXPECT_EQ(ack["message"], "Response too large (25001 chars). Wrote to /data/edge.json");
    EXPECT_EQ(storage_->writeCount(), 1);
}

TEST_F(ResultSpillerTest, Inline_NonAsciiCountsEscapedLength) {
    domain::OutputOptions options;
    options.outputToFile = false;
    options.outputPath = "/data/accents.json";

    // 4200 символов "é": 4200 в UTF-8, но 25200 после экранирования
    domain::TransactionSummary summary;
    ordered_json txn;
    txn["id"] = "t1";
    std::string memo;
    for (int i = 0; i < 4200; ++i) {
        memo += "\xC3\xA9";
    }
    txn["memo"] = memo;
    summary.items.push_back(txn);

    auto ack = ordered_json::parse(spiller_->deliver(summary, options, "transactions"));

    EXPECT_EQ(ack["output_file"], "/data/accents.json");
    EXPECT_EQ(storage_->writeCount(), 1);
}

// ============================================================================
// ТЕСТЫ: ошибки записи и подсчёт символов
// ============================================================================

TEST_F(ResultSpillerTest, WriteFailure_Propagates) {
    storage_->setFailing(true);
    domain::OutputOptions options;
    options.outputPath = "/readonly/out.json";

    EXPECT_THROW(spiller_->deliver(smallSummary(), options, "transactions"), domain::PersistenceError);
}

TEST_F(ResultSpillerTest, CharacterCount_NonAsciiCountsAsEscape) {
    EXPECT_EQ(ResultSpiller::characterCount("abc"), 3u);
    EXPECT_EQ(ResultSpiller::characterCount("caf\xC3\xA9"), 9u);
    EXPECT_EQ(ResultSpiller::characterCount("\xE2\x82\xAC" "1"), 7u);
    EXPECT_EQ(ResultSpiller::characterCount("\xF0\x9F\x98\x80"), 12u);
    EXPECT_EQ(ResultSpiller::characterCount(""), 0u);
}
