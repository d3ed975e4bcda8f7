#pragma once

#include "Errors.hpp"
#include <string>
#include <cstdint>
#include <cctype>
#include <compare>
#include <optional>
#include <stdexcept>

namespace bookkeeping::domain {

/**
 * @brief Денежная сумма с точностью до минорной единицы
 *
 * Хранит значение в сотых долях (копейки, пайсы) в int64_t,
 * поэтому сложение и вычитание точные: отмена транзакции
 * восстанавливает баланс бит в бит.
 */
class Money {
public:
    int64_t cents = 0;

    Money() = default;

    static Money fromCents(int64_t value) {
        Money m;
        m.cents = value;
        return m;
    }

    /**
     * @brief Разобрать сумму из пользовательского ввода
     *
     * Допускает разделители разрядов ("1,234.56") и обозначения валюты
     * (₹, Rs., Rs, $, INR). Не более двух знаков после точки.
     *
     * @throws ValidationError{field="amount"} при некорректном вводе
     */
    static Money parse(const std::string& input) {
        std::string text = input;
        for (const char* marker : {"INR", "Rs.", "Rs", "\xE2\x82\xB9", "$"}) {
            std::string m(marker);
            for (auto pos = text.find(m); pos != std::string::npos; pos = text.find(m)) {
                text.erase(pos, m.size());
            }
        }

        std::string clean;
        for (char c : text) {
            if (c == ',' || std::isspace(static_cast<unsigned char>(c))) continue;
            clean += c;
        }

        if (clean.empty()) {
            throw ValidationError("amount", "value is required");
        }

        bool negative = false;
        std::size_t i = 0;
        if (clean[0] == '-' || clean[0] == '+') {
            negative = clean[0] == '-';
            ++i;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int wholeDigits = 0;
        int fractionDigits = 0;
        bool seenPoint = false;

        for (; i < clean.size(); ++i) {
            char c = clean[i];
            if (c == '.') {
                if (seenPoint) {
                    throw ValidationError("amount", "malformed number '" + input + "'");
                }
                seenPoint = true;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw ValidationError("amount", "malformed number '" + input + "'");
            }
            if (seenPoint) {
                if (++fractionDigits > 2) {
                    throw ValidationError("amount", "at most 2 decimal places allowed");
                }
                fraction = fraction * 10 + (c - '0');
            } else {
                if (++wholeDigits > 15) {
                    throw ValidationError("amount", "value is too large");
                }
                whole = whole * 10 + (c - '0');
            }
        }

        if (wholeDigits == 0 && fractionDigits == 0) {
            throw ValidationError("amount", "malformed number '" + input + "'");
        }
        if (fractionDigits == 1) {
            fraction *= 10;
        }

        int64_t value = whole * 100 + fraction;
        return fromCents(negative ? -value : value);
    }

    bool isPositive() const { return cents > 0; }
    bool isZero() const { return cents == 0; }

    /**
     * @brief "-500.00", "45000.00"
     */
    std::string toString() const {
        return sign() + digits(false);
    }

    /**
     * @brief "₹1,234.56", "-₹500.00" — для отображения
     */
    std::string format(const std::string& symbol) const {
        return sign() + symbol + digits(true);
    }

    /**
     * @brief Сумма или nullopt, если результат не помещается в int64_t
     */
    std::optional<Money> checkedAdd(const Money& other) const {
        int64_t result = 0;
        if (__builtin_add_overflow(cents, other.cents, &result)) {
            return std::nullopt;
        }
        return fromCents(result);
    }

    std::optional<Money> checkedSub(const Money& other) const {
        int64_t result = 0;
        if (__builtin_sub_overflow(cents, other.cents, &result)) {
            return std::nullopt;
        }
        return fromCents(result);
    }

    /// @throws std::overflow_error
    Money operator+(const Money& other) const { return orThrow(checkedAdd(other), "+", other); }
    Money operator-(const Money& other) const { return orThrow(checkedSub(other), "-", other); }
    Money operator-() const { return Money{} - *this; }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = *this - other;
        return *this;
    }

    auto operator<=>(const Money& other) const = default;

private:
    Money orThrow(const std::optional<Money>& result, const char* op, const Money& other) const {
        if (!result) {
            throw std::overflow_error("Money overflow: " + std::to_string(cents) + " " + op
                                      + " " + std::to_string(other.cents) + " cents");
        }
        return *result;
    }

    std::string sign() const {
        return cents < 0 ? "-" : "";
    }

    std::string digits(bool grouped) const {
        // Через uint64_t: -INT64_MIN не представим в int64_t
        uint64_t abs = cents < 0 ? 0 - static_cast<uint64_t>(cents) : static_cast<uint64_t>(cents);
        std::string whole = std::to_string(abs / 100);
        if (grouped) {
            for (int pos = static_cast<int>(whole.size()) - 3; pos > 0; pos -= 3) {
                whole.insert(static_cast<std::size_t>(pos), ",");
            }
        }
        uint64_t frac = abs % 100;
        return whole + "." + (frac < 10 ? "0" : "") + std::to_string(frac);
    }
};

} // namespace bookkeeping::domain
