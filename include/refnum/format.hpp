#ifndef REFNUM_FORMAT_HPP
#define REFNUM_FORMAT_HPP

#include <charconv>
#include <concepts>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

#include <refnum/primitive.hpp>

namespace refnum {

namespace detail {

// Shortest round-trip digits in the classic numeric layout: plain decimal
// with at least one fractional digit for 1e-3 <= |x| < 1e7, otherwise
// "d.dddE<exp>". NaN and the infinities are spelled out.
template <std::floating_point F> std::string format_floating(F x) {
    if (x != x)
        return "NaN";
    if (x == std::numeric_limits<F>::infinity())
        return "Infinity";
    if (x == -std::numeric_limits<F>::infinity())
        return "-Infinity";

    char buf[64];
    const F mag = x < 0 ? -x : x;
    const bool plain = mag == 0 || (mag >= F(1e-3) && mag < F(1e7));
    const auto fmt = plain ? std::chars_format::fixed : std::chars_format::scientific;
    const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), x, fmt);
    if (ec != std::errc{})
        throw std::runtime_error("format_floating: to_chars failed");
    std::string digits(buf, end);

    if (plain) {
        if (digits.find('.') == std::string::npos)
            digits += ".0";
        return digits;
    }

    // "1.5e+10" -> "1.5E10", "1e-05" -> "1.0E-5"
    const auto e = digits.find('e');
    std::string mantissa = digits.substr(0, e);
    if (mantissa.find('.') == std::string::npos)
        mantissa += ".0";
    const char* first = digits.data() + e + 1;
    const char* last = digits.data() + digits.size();
    if (*first == '+')
        ++first;
    int exponent = 0;
    const auto [ptr, perr] = std::from_chars(first, last, exponent);
    if (perr != std::errc{} || ptr != last)
        throw std::runtime_error("format_floating: malformed exponent");
    return mantissa + "E" + std::to_string(exponent);
}

} // namespace detail

template <Primitive P> std::string format_primitive(P x) {
    if constexpr (std::same_as<P, char>)
        return std::string(1, x);
    else if constexpr (std::floating_point<P>)
        return detail::format_floating(x);
    else
        return std::to_string(static_cast<long long>(x));
}

} // namespace refnum

#endif // REFNUM_FORMAT_HPP
