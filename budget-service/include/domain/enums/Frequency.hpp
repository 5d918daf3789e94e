#pragma once

#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Периодичность запланированной транзакции (значения YNAB API)
 */
enum class Frequency {
    NEVER,
    DAILY,
    WEEKLY,
    EVERY_OTHER_WEEK,
    TWICE_A_MONTH,
    EVERY_4_WEEKS,
    MONTHLY,
    EVERY_OTHER_MONTH,
    EVERY_3_MONTHS,
    EVERY_4_MONTHS,
    TWICE_A_YEAR,
    YEARLY,
    EVERY_OTHER_YEAR
};

inline std::string toString(Frequency frequency) {
    switch (frequency) {
        case Frequency::NEVER: return "never";
        case Frequency::DAILY: return "daily";
        case Frequency::WEEKLY: return "weekly";
        case Frequency::EVERY_OTHER_WEEK: return "everyOtherWeek";
        case Frequency::TWICE_A_MONTH: return "twiceAMonth";
        case Frequency::EVERY_4_WEEKS: return "every4Weeks";
        case Frequency::MONTHLY: return "monthly";
        case Frequency::EVERY_OTHER_MONTH: return "everyOtherMonth";
        case Frequency::EVERY_3_MONTHS: return "every3Months";
        case Frequency::EVERY_4_MONTHS: return "every4Months";
        case Frequency::TWICE_A_YEAR: return "twiceAYear";
        case Frequency::YEARLY: return "yearly";
        case Frequency::EVERY_OTHER_YEAR: return "everyOtherYear";
        default: return "never";
    }
}

inline std::optional<Frequency> parseFrequency(const std::string& str) {
    if (str == "never") return Frequency::NEVER;
    if (str == "daily") return Frequency::DAILY;
    if (str == "weekly") return Frequency::WEEKLY;
    if (str == "everyOtherWeek") return Frequency::EVERY_OTHER_WEEK;
    if (str == "twiceAMonth") return Frequency::TWICE_A_MONTH;
    if (str == "every4Weeks") return Frequency::EVERY_4_WEEKS;
    if (str == "monthly") return Frequency::MONTHLY;
    if (str == "everyOtherMonth") return Frequency::EVERY_OTHER_MONTH;
    if (str == "every3Months") return Frequency::EVERY_3_MONTHS;
    if (str == "every4Months") return Frequency::EVERY_4_MONTHS;
    if (str == "twiceAYear") return Frequency::TWICE_A_YEAR;
    if (str == "yearly") return Frequency::YEARLY;
    if (str == "everyOtherYear") return Frequency::EVERY_OTHER_YEAR;
    return std::nullopt;
}

} // namespace budget::domain
