#include <gtest/gtest.h>

#include "adapters/primary/ToolArguments.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using namespace budget;
using budget::adapters::primary::ToolArguments;
using nlohmann::json;

// ============================================================================
// ТЕСТЫ: строки и идентификаторы
// ============================================================================

TEST(ToolArgumentsTest, RequiredId_StripsWhitespace) {
    ToolArguments args(json{{"budget_id", "  last-used \n"}});

    EXPECT_EQ(args.requiredId("budget_id"), "last-used");
}

TEST(ToolArgumentsTest, RequiredId_MissingOrBlank_Throws) {
    EXPECT_THROW(ToolArguments(json::object()).requiredId("budget_id"), domain::ValidationError);
    EXPECT_THROW(ToolArguments(json{{"budget_id", "   "}}).requiredId("budget_id"), domain::ValidationError);
    EXPECT_THROW(ToolArguments(json{{"budget_id", 42}}).requiredId("budget_id"), domain::ValidationError);
}

TEST(ToolArgumentsTest, NullArguments_TreatedAsEmpty) {
    ToolArguments args(nullptr);

    EXPECT_FALSE(args.optionalText("memo").has_value());
    EXPECT_TRUE(args.flag("output_to_file", true));
}

TEST(ToolArgumentsTest, NonObjectArguments_Throws) {
    EXPECT_THROW(ToolArguments{json::array()}, domain::ValidationError);
}

TEST(ToolArgumentsTest, UnknownKeysIgnored) {
    ToolArguments args(json{{"budget_id", "b1"}, {"extra", {1, 2, 3}}});

    EXPECT_EQ(args.requiredId("budget_id"), "b1");
}

// ============================================================================
// ТЕСТЫ: даты и memo
// ============================================================================

TEST(ToolArgumentsTest, Dates) {
    ToolArguments args(json{{"date", "2024-01-15"}, {"bad", "15/01/2024"}});

    EXPECT_EQ(args.requiredDate("date"), "2024-01-15");
    EXPECT_THROW(args.optionalDate("bad"), domain::ValidationError);
    EXPECT_FALSE(args.optionalDate("since_date").has_value());
    EXPECT_THROW(args.requiredDate("month"), domain::ValidationError);
}

TEST(ToolArgumentsTest, Memo_LengthInCharacters) {
    std::string twoHundredCyrillic;
    for (int i = 0; i < 200; ++i) {
        twoHundredCyrillic += "\xD0\x96";
    }

    EXPECT_EQ(ToolArguments(json{{"memo", twoHundredCyrillic}}).memo(), twoHundredCyrillic);
    EXPECT_THROW(ToolArguments(json{{"memo", std::string(201, 'a')}}).memo(), domain::ValidationError);
}

TEST(ToolArgumentsTest, Memo_EmptyStringKept) {
    auto memo = ToolArguments(json{{"memo", ""}}).memo();

    ASSERT_TRUE(memo.has_value());
    EXPECT_EQ(*memo, "");
}

// ============================================================================
// ТЕСТЫ: числа, флаги, перечисления
// ============================================================================

TEST(ToolArgumentsTest, Integer_AcceptsIntegralFloat) {
    ToolArguments args(json{{"a", 1000}, {"b", 2000.0}, {"c", 1.5}, {"d", "1000"}});

    EXPECT_EQ(args.optionalInteger("a"), std::optional<int64_t>(1000));
    EXPECT_EQ(args.optionalInteger("b"), std::optional<int64_t>(2000));
    EXPECT_THROW(args.optionalInteger("c"), domain::ValidationError);
    EXPECT_THROW(args.optionalInteger("d"), domain::ValidationError);
    EXPECT_FALSE(args.optionalInteger("missing").has_value());
}

TEST(ToolArgumentsTest, Integer_BeyondInt64_Throws) {
    ToolArguments args(json{
        {"amount_milliunits", 10000000000000000000ULL},
        {"largest", 9223372036854775807LL}
    });

    EXPECT_THROW(args.optionalInteger("amount_milliunits"), domain::ValidationError);
    EXPECT_EQ(args.optionalInteger("largest"),
              std::optional<int64_t>(std::numeric_limits<int64_t>::max()));
}

TEST(ToolArgumentsTest, Number_AcceptsIntegers) {
    ToolArguments args(json{{"amount_dollars", -12}});

    EXPECT_EQ(args.optionalNumber("amount_dollars"), std::optional<double>(-12.0));
}

TEST(ToolArgumentsTest, Flag_RejectsNonBoolean) {
    ToolArguments args(json{{"summary_only", "yes"}});

    EXPECT_THROW(args.flag("summary_only", false), domain::ValidationError);
}

TEST(ToolArgumentsTest, Format) {
    EXPECT_EQ(ToolArguments(json::object()).format(domain::ResponseFormat::JSON), domain::ResponseFormat::JSON);
    EXPECT_EQ(ToolArguments(json{{"response_format", "markdown"}}).format(domain::ResponseFormat::JSON),
              domain::ResponseFormat::MARKDOWN);
    EXPECT_THROW(ToolArguments(json{{"response_format", "xml"}}).format(domain::ResponseFormat::JSON),
                 domain::ValidationError);
}

TEST(ToolArgumentsTest, ClearedAndFrequency) {
    ToolArguments args(json{{"cleared", "reconciled"}, {"frequency", "everyOtherWeek"}});

    EXPECT_EQ(args.cleared(), std::optional<domain::ClearedStatus>(domain::ClearedStatus::RECONCILED));
    EXPECT_EQ(args.frequency(), domain::Frequency::EVERY_OTHER_WEEK);
    EXPECT_THROW(ToolArguments(json{{"cleared", "pending"}}).cleared(), domain::ValidationError);
    EXPECT_THROW(ToolArguments(json{{"frequency", "hourly"}}).frequency(), domain::ValidationError);
}
