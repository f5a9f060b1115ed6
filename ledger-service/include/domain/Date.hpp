#pragma once

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Календарная дата операции (без времени)
 *
 * Формат строки: ISO 8601 "YYYY-MM-DD".
 */
class Date {
public:
    std::chrono::sys_days value;

    Date() : value(std::chrono::year{1970} / std::chrono::January / 1) {}

    explicit Date(std::chrono::sys_days days) : value(days) {}

    static Date of(int year, unsigned month, unsigned day) {
        std::chrono::year_month_day ymd{
            std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
        if (!ymd.ok()) {
            throw std::invalid_argument("Invalid date: " + std::to_string(year) + "-" +
                                        std::to_string(month) + "-" + std::to_string(day));
        }
        return Date(std::chrono::sys_days{ymd});
    }

    static Date today() {
        return Date(std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now()));
    }

    /**
     * @throws std::invalid_argument если строка не "YYYY-MM-DD" или дата не существует
     */
    static Date fromString(const std::string& str) {
        if (str.size() != 10 || str[4] != '-' || str[7] != '-') {
            throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + str);
        }
        for (size_t i = 0; i < str.size(); ++i) {
            if (i != 4 && i != 7 && (str[i] < '0' || str[i] > '9')) {
                throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + str);
            }
        }
        return of(std::stoi(str.substr(0, 4)),
                  static_cast<unsigned>(std::stoi(str.substr(5, 2))),
                  static_cast<unsigned>(std::stoi(str.substr(8, 2))));
    }

    std::string toString() const {
        std::chrono::year_month_day ymd{value};
        std::ostringstream ss;
        ss << std::setfill('0')
           << std::setw(4) << static_cast<int>(ymd.year()) << "-"
           << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
           << std::setw(2) << static_cast<unsigned>(ymd.day());
        return ss.str();
    }

    Date plusDays(int days) const {
        return Date(value + std::chrono::days{days});
    }

    bool operator==(const Date& other) const { return value == other.value; }
    bool operator!=(const Date& other) const { return value != other.value; }
    bool operator<(const Date& other) const { return value < other.value; }
    bool operator>(const Date& other) const { return value > other.value; }
    bool operator<=(const Date& other) const { return value <= other.value; }
    bool operator>=(const Date& other) const { return value >= other.value; }
};

} // namespace ledger::domain
