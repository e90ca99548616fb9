#pragma once

#include <cstdint>
#include <cmath>
#include <cstdlib>

namespace finance::domain {

/**
 * @brief Денежная сумма со знаком
 * 
 * Хранит значение в центах, чтобы баланс счёта и сумма его транзакций
 * совпадали точно, без накопления ошибки округления.
 * Положительное значение - приход, отрицательное - расход (или долг).
 */
class Money {
public:
    int64_t cents = 0;      ///< Сумма в центах

    Money() = default;

    explicit Money(int64_t c) : cents(c) {}

    /**
     * @brief Создать из дробного значения (округление до цента)
     */
    static Money fromDouble(double value) {
        return Money(static_cast<int64_t>(std::llround(value * 100.0)));
    }

    double toDouble() const {
        return static_cast<double>(cents) / 100.0;
    }

    bool isZero() const { return cents == 0; }
    bool isPositive() const { return cents > 0; }
    bool isNegative() const { return cents < 0; }

    Money abs() const {
        return Money(std::llabs(cents));
    }

    /**
     * @brief Доля от суммы, округлённая до цента
     * @param fraction Доля (0.03 = 3%)
     */
    Money percentOf(double fraction) const {
        return Money::fromDouble(toDouble() * fraction);
    }

    Money operator+(const Money& other) const { return Money(cents + other.cents); }
    Money operator-(const Money& other) const { return Money(cents - other.cents); }
    Money operator-() const { return Money(-cents); }

    Money& operator+=(const Money& other) {
        cents += other.cents;
        return *this;
    }

    Money& operator-=(const Money& other) {
        cents -= other.cents;
        return *this;
    }

    bool operator==(const Money& other) const { return cents == other.cents; }
    bool operator!=(const Money& other) const { return cents != other.cents; }
    bool operator<(const Money& other) const { return cents < other.cents; }
    bool operator>(const Money& other) const { return cents > other.cents; }
    bool operator<=(const Money& other) const { return cents <= other.cents; }
    bool operator>=(const Money& other) const { return cents >= other.cents; }
};

} // namespace finance::domain
