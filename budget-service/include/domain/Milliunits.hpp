#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace budget::domain {

/**
 * @brief Денежные суммы YNAB в milliunits
 *
 * YNAB передаёт суммы целым числом, где 1000 = 1.00 единица валюты.
 * Целое значение является источником истины, строка нужна только для отображения
 * и никогда не участвует в арифметике.
 */
class Milliunits {
public:
    static constexpr int64_t PER_UNIT = 1000;

    /**
     * @brief 12340 → "$12.34", -500 → "-$0.50", 1234567890 → "$1,234,567.89"
     *
     * Знак определяется по целому значению: любое отрицательное число получает "-$",
     * даже если после округления остаётся "$0.00".
     * Третий знак после запятой округляется half-up по точному десятичному значению.
     */
    static std::string toDisplay(int64_t milliunits) {
        // Модуль через uint64_t: для INT64_MIN нет переполнения
        const uint64_t magnitude = milliunits < 0
            ? uint64_t{0} - static_cast<uint64_t>(milliunits)
            : static_cast<uint64_t>(milliunits);

        const uint64_t cents = magnitude / 10 + (magnitude % 10 >= 5 ? 1 : 0);
        const uint64_t fraction = cents % 100;

        std::string result = milliunits < 0 ? "-$" : "$";
        result += groupThousands(cents / 100);
        result += '.';
        if (fraction < 10) {
            result += '0';
        }
        result += std::to_string(fraction);
        return result;
    }

    /**
     * @brief Доллары → milliunits с отбрасыванием дробной части (к нулю)
     *
     * 19.99 → 19990, -1.9999 → -1999. Путь с потерями: суммы с долями
     * меньше 1/1000 не восстанавливаются.
     * NaN даёт 0, значения за пределами int64 насыщаются до границ.
     */
    static int64_t toScaled(double dollars) {
        const double scaled = dollars * static_cast<double>(PER_UNIT);
        if (std::isnan(scaled)) {
            return 0;
        }

        constexpr double upper = static_cast<double>(std::numeric_limits<int64_t>::max());
        if (scaled >= upper) {
            return std::numeric_limits<int64_t>::max();
        }
        if (scaled <= -upper) {
            return std::numeric_limits<int64_t>::min();
        }
        return static_cast<int64_t>(scaled);
    }

private:
    static std::string groupThousands(uint64_t value) {
        std::string digits = std::to_string(value);
        std::string grouped;
        grouped.reserve(digits.size() + digits.size() / 3);

        for (size_t i = 0; i < digits.size(); ++i) {
            if (i > 0 && (digits.size() - i) % 3 == 0) {
                grouped += ',';
            }
            grouped += digits[i];
        }
        return grouped;
    }
};

} // namespace budget::domain
