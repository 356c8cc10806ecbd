#ifndef REFNUM_RESULT_HPP
#define REFNUM_RESULT_HPP

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace refnum {

// Raised by ensuring_valid() when the caller's claim that a value is valid
// turns out to be false.
class AssertionError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

// --- Or: exactly one of a good value or a bad value ---

template <typename G> struct Good {
    G value;

    constexpr bool operator==(const Good&) const = default;
};

template <typename B> struct Bad {
    B value;

    constexpr bool operator==(const Bad&) const = default;
};

template <typename G> Good(G) -> Good<G>;
template <typename B> Bad(B) -> Bad<B>;

template <typename G, typename B> class Or {
  public:
    using good_type = G;
    using bad_type = B;

    constexpr Or(Good<G> g) : rep_(std::in_place_index<0>, std::move(g)) {}
    constexpr Or(Bad<B> b) : rep_(std::in_place_index<1>, std::move(b)) {}

    constexpr bool is_good() const noexcept { return rep_.index() == 0; }
    constexpr bool is_bad() const noexcept { return rep_.index() == 1; }

    constexpr const G& good() const {
        if (!is_good())
            throw std::logic_error("Or::good() called on a Bad");
        return std::get<0>(rep_).value;
    }

    constexpr const B& bad() const {
        if (!is_bad())
            throw std::logic_error("Or::bad() called on a Good");
        return std::get<1>(rep_).value;
    }

    constexpr G get_or_else(G fallback) const {
        return is_good() ? std::get<0>(rep_).value : std::move(fallback);
    }

    constexpr std::optional<G> to_optional() const {
        if (is_good())
            return std::get<0>(rep_).value;
        return std::nullopt;
    }

    template <typename F>
    constexpr auto map(F&& f) const
        -> Or<std::invoke_result_t<F&, const G&>, B> {
        if (is_good())
            return Good{std::invoke(f, std::get<0>(rep_).value)};
        return Bad<B>{std::get<1>(rep_).value};
    }

    constexpr bool operator==(const Or&) const = default;

  private:
    std::variant<Good<G>, Bad<B>> rep_;
};

// --- Validation: pass, or fail with an error ---

struct Pass {
    constexpr bool operator==(const Pass&) const = default;
};

template <typename E> struct Fail {
    E error;

    constexpr bool operator==(const Fail&) const = default;
};

template <typename E> Fail(E) -> Fail<E>;

template <typename E> class Validation {
  public:
    using error_type = E;

    constexpr Validation(Pass) noexcept {}
    constexpr Validation(Fail<E> f) : error_(std::move(f.error)) {}

    constexpr bool is_pass() const noexcept { return !error_.has_value(); }
    constexpr bool is_fail() const noexcept { return error_.has_value(); }

    constexpr const E& error() const {
        if (!error_)
            throw std::logic_error("Validation::error() called on a Pass");
        return *error_;
    }

    constexpr bool operator==(const Validation&) const = default;

  private:
    std::optional<E> error_{};
};

} // namespace refnum

#endif // REFNUM_RESULT_HPP
