#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace crossbook {

namespace detail {

// 128-bit intermediates keep products exact before rescaling.
// Rounds half away from zero.
inline std::int64_t mul_div(std::int64_t a, std::int64_t b, std::int64_t divisor) {
    __int128 product = static_cast<__int128>(a) * static_cast<__int128>(b);
    __int128 quotient = product / divisor;
    __int128 remainder = product % divisor;
    if (remainder < 0) {
        remainder = -remainder;
    }
    if (remainder * 2 >= divisor) {
        quotient += (product < 0) ? -1 : 1;
    }
    if (quotient > std::numeric_limits<std::int64_t>::max() ||
        quotient < std::numeric_limits<std::int64_t>::min()) {
        throw std::overflow_error("Fixed-point multiplication overflow");
    }
    return static_cast<std::int64_t>(quotient);
}

}  // namespace detail

/// Exact decimal value stored as a scaled int64_t
/// Prices and quantities arrive as decimal strings and are only ever parsed into this type
/// @tparam Decimals Number of decimal places (e.g., 8 for crypto prices)
template <int Decimals>
class FixedPoint {
public:
    static_assert(Decimals >= 0 && Decimals <= 18,
                  "Decimals must be between 0 and 18");

    using underlying_type = std::int64_t;

    /// Scale factor (10^Decimals)
    static constexpr underlying_type scale = []() {
        underlying_type s = 1;
        for (int i = 0; i < Decimals; ++i) {
            s *= 10;
        }
        return s;
    }();

    constexpr FixedPoint() noexcept : value_(0) {}

    static constexpr FixedPoint from_raw(underlying_type raw) noexcept {
        FixedPoint fp;
        fp.value_ = raw;
        return fp;
    }

    /// Construct from integer
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T>>>
    explicit constexpr FixedPoint(T i) noexcept
        : value_(static_cast<underlying_type>(i) * scale) {}

    [[nodiscard]] constexpr underlying_type raw() const noexcept {
        return value_;
    }

    /// Convert to double (display only, never used for keys or arithmetic)
    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(value_) / static_cast<double>(scale);
    }

    /// Shortest exact decimal rendering ("42150.5", "0.00000001", "-3")
    [[nodiscard]] std::string to_string() const {
        if (value_ == 0) {
            return "0";
        }

        bool negative = value_ < 0;
        // Avoid negating INT64_MIN
        auto abs_val = negative ? -static_cast<__int128>(value_) : static_cast<__int128>(value_);

        auto integer_part = static_cast<unsigned long long>(abs_val / scale);
        auto frac_part = static_cast<unsigned long long>(abs_val % scale);

        std::string result = std::to_string(integer_part);

        if (frac_part > 0) {
            std::string frac_str = std::to_string(frac_part);
            frac_str.insert(0, static_cast<std::size_t>(Decimals) - frac_str.size(), '0');
            while (frac_str.back() == '0') {
                frac_str.pop_back();
            }
            result += '.';
            result += frac_str;
        }

        if (negative) {
            result.insert(0, 1, '-');
        }
        return result;
    }

    /// Parse from a decimal string
    /// Fractional digits beyond Decimals are accepted only when they are zero,
    /// so a parsed value is always exactly the value on the wire.
    /// @throws std::invalid_argument for invalid format or lost precision
    /// @throws std::overflow_error if value is too large
    [[nodiscard]] static FixedPoint parse(std::string_view str) {
        if (str.empty()) {
            throw std::invalid_argument("Invalid number format: empty string");
        }

        bool negative = false;
        std::size_t pos = 0;

        if (str[0] == '-') {
            negative = true;
            pos = 1;
        } else if (str[0] == '+') {
            pos = 1;
        }

        if (pos >= str.length()) {
            throw std::invalid_argument("Invalid number format: sign only");
        }

        underlying_type integer_part = 0;
        underlying_type frac_part = 0;
        int frac_digits = 0;
        bool in_fraction = false;
        bool has_digits = false;

        constexpr underlying_type max_integer_part =
            std::numeric_limits<underlying_type>::max() / scale;

        for (; pos < str.length(); ++pos) {
            char c = str[pos];
            if (c == '.') {
                if (in_fraction) {
                    throw std::invalid_argument("Multiple decimal points");
                }
                in_fraction = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid character in number");
            }

            has_digits = true;
            int digit = c - '0';
            if (in_fraction) {
                if (frac_digits < Decimals) {
                    frac_part = frac_part * 10 + digit;
                    ++frac_digits;
                } else if (digit != 0) {
                    throw std::invalid_argument("Too many fractional digits for fixed-point precision");
                }
            } else {
                integer_part = integer_part * 10 + digit;
                if (integer_part > max_integer_part) {
                    throw std::overflow_error("Value too large for fixed-point representation");
                }
            }
        }

        if (!has_digits) {
            throw std::invalid_argument("No digits found in number");
        }

        while (frac_digits < Decimals) {
            frac_part *= 10;
            ++frac_digits;
        }

        if (integer_part == max_integer_part &&
            frac_part > std::numeric_limits<underlying_type>::max() % scale) {
            throw std::overflow_error("Value too large for fixed-point representation");
        }

        underlying_type result = integer_part * scale + frac_part;
        if (negative) {
            result = -result;
        }

        return from_raw(result);
    }

    // Comparison operators
    [[nodiscard]] constexpr bool operator==(const FixedPoint& other) const noexcept {
        return value_ == other.value_;
    }

    [[nodiscard]] constexpr bool operator!=(const FixedPoint& other) const noexcept {
        return value_ != other.value_;
    }

    [[nodiscard]] constexpr bool operator<(const FixedPoint& other) const noexcept {
        return value_ < other.value_;
    }

    [[nodiscard]] constexpr bool operator<=(const FixedPoint& other) const noexcept {
        return value_ <= other.value_;
    }

    [[nodiscard]] constexpr bool operator>(const FixedPoint& other) const noexcept {
        return value_ > other.value_;
    }

    [[nodiscard]] constexpr bool operator>=(const FixedPoint& other) const noexcept {
        return value_ >= other.value_;
    }

    // Arithmetic operators
    [[nodiscard]] constexpr FixedPoint operator+(const FixedPoint& other) const noexcept {
        return from_raw(value_ + other.value_);
    }

    [[nodiscard]] constexpr FixedPoint operator-(const FixedPoint& other) const noexcept {
        return from_raw(value_ - other.value_);
    }

    [[nodiscard]] constexpr FixedPoint operator-() const noexcept {
        return from_raw(-value_);
    }

    /// Multiplication: result = (a * b) / scale, exact up to the last decimal
    /// @throws std::overflow_error if the product does not fit
    [[nodiscard]] FixedPoint operator*(const FixedPoint& other) const {
        return from_raw(detail::mul_div(value_, other.value_, scale));
    }

    /// Addition that refuses to wrap
    /// @throws std::overflow_error if the sum does not fit
    [[nodiscard]] FixedPoint checked_add(const FixedPoint& other) const {
        underlying_type sum;
        if (__builtin_add_overflow(value_, other.value_, &sum)) {
            throw std::overflow_error("Fixed-point addition overflow");
        }
        return from_raw(sum);
    }

    /// @throws std::overflow_error if the difference does not fit
    [[nodiscard]] FixedPoint checked_sub(const FixedPoint& other) const {
        underlying_type difference;
        if (__builtin_sub_overflow(value_, other.value_, &difference)) {
            throw std::overflow_error("Fixed-point subtraction overflow");
        }
        return from_raw(difference);
    }

    constexpr FixedPoint& operator+=(const FixedPoint& other) noexcept {
        value_ += other.value_;
        return *this;
    }

    constexpr FixedPoint& operator-=(const FixedPoint& other) noexcept {
        value_ -= other.value_;
        return *this;
    }

    FixedPoint& operator*=(const FixedPoint& other) {
        *this = *this * other;
        return *this;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return value_ == 0;
    }

    [[nodiscard]] constexpr bool is_positive() const noexcept {
        return value_ > 0;
    }

    [[nodiscard]] constexpr bool is_negative() const noexcept {
        return value_ < 0;
    }

    [[nodiscard]] constexpr FixedPoint abs() const noexcept {
        return from_raw(value_ < 0 ? -value_ : value_);
    }

    static constexpr FixedPoint zero() noexcept {
        return FixedPoint{};
    }

    static constexpr FixedPoint one() noexcept {
        return from_raw(scale);
    }

private:
    underlying_type value_;
};

}  // namespace crossbook

namespace std {
template <int Decimals>
struct hash<crossbook::FixedPoint<Decimals>> {
    std::size_t operator()(const crossbook::FixedPoint<Decimals>& fp) const noexcept {
        return std::hash<typename crossbook::FixedPoint<Decimals>::underlying_type>{}(fp.raw());
    }
};
}  // namespace std
