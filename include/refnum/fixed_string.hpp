#ifndef REFNUM_FIXED_STRING_HPP
#define REFNUM_FIXED_STRING_HPP

#include <cstddef>

namespace refnum {

// Compile-time string builder for diagnostics and predicate rendering.
template <std::size_t N = 256> struct FixedString {
    char data[N]{};
    std::size_t len{0};

    consteval FixedString() = default;
    consteval FixedString(const char* s) {
        while (s[len] != '\0' && len < N - 1) { data[len] = s[len]; ++len; }
    }

    consteval void append(const char* s) {
        for (std::size_t i = 0; s[i] != '\0' && len < N - 1; ++i)
            data[len++] = s[i];
    }
    template <std::size_t M> consteval void append(const FixedString<M>& o) {
        for (std::size_t i = 0; i < o.len && len < N - 1; ++i)
            data[len++] = o.data[i];
    }
    consteval void append_char(char c) { if (len < N - 1) data[len++] = c; }

    consteval void append_int(long long v) {
        unsigned long long mag = static_cast<unsigned long long>(v);
        if (v < 0) { append_char('-'); mag = 0ULL - mag; }
        if (mag == 0) { append_char('0'); return; }
        char buf[24]{};
        int pos = 0;
        while (mag > 0) { buf[pos++] = static_cast<char>('0' + mag % 10); mag /= 10; }
        for (int i = pos - 1; i >= 0; --i) append_char(buf[i]);
    }

    // Whole numbers print without a fraction; anything else gets at most
    // six fractional digits. Only used for bound constants.
    consteval void append_double(double v) {
        if (v < 0) { append_char('-'); v = -v; }
        const auto integer_part = static_cast<long long>(v);
        double frac = v - static_cast<double>(integer_part);
        append_int(integer_part);
        if (frac > 0.0) {
            append_char('.');
            for (int i = 0; i < 6 && frac > 0.0; ++i) {
                frac *= 10.0;
                const int digit = static_cast<int>(frac);
                append_char(static_cast<char>('0' + digit));
                frac -= digit;
            }
        }
    }

    consteval bool operator==(const char* s) const {
        for (std::size_t i = 0; i < len; ++i)
            if (data[i] != s[i]) return false;
        return s[len] == '\0';
    }
};

} // namespace refnum

#endif // REFNUM_FIXED_STRING_HPP
