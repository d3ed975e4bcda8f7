#pragma once

#include "Errors.hpp"
#include <string>
#include <ctime>
#include <cstdio>
#include <compare>

namespace bookkeeping::domain {

/**
 * @brief Календарная дата транзакции (без времени суток)
 *
 * Формат хранения и ввода: YYYY-MM-DD.
 */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    static Date today() {
        std::time_t now = std::time(nullptr);
        std::tm tm = *std::localtime(&now);
        return Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
    }

    /**
     * @throws ValidationError{field="date"} если строка не YYYY-MM-DD или дата не существует
     */
    static Date parse(const std::string& str) {
        if (str.size() != 10 || str[4] != '-' || str[7] != '-') {
            throw ValidationError("date", "expected YYYY-MM-DD, got '" + str + "'");
        }
        for (std::size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
            if (str[i] < '0' || str[i] > '9') {
                throw ValidationError("date", "expected YYYY-MM-DD, got '" + str + "'");
            }
        }

        Date d{std::stoi(str.substr(0, 4)), std::stoi(str.substr(5, 2)), std::stoi(str.substr(8, 2))};
        if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > daysInMonth(d.year, d.month)) {
            throw ValidationError("date", "no such calendar date '" + str + "'");
        }
        return d;
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    auto operator<=>(const Date&) const = default;

private:
    static int daysInMonth(int y, int m) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        return (m == 2 && leap) ? 29 : days[m - 1];
    }
};

} // namespace bookkeeping::domain
