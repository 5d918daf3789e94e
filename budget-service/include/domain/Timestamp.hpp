#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace budget::domain {

/**
 * @brief Временная метка
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Локальное время с точностью до секунды для имён файлов: 20240131_235959
     */
    std::string toFileStamp() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        localtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
        return ss.str();
    }
};

} // namespace budget::domain
