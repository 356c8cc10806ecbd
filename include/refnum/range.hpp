#ifndef REFNUM_RANGE_HPP
#define REFNUM_RANGE_HPP

#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <stdexcept>

#include <refnum/primitive.hpp>

namespace refnum {

// --- NumericRange: lazy arithmetic progression over a primitive ---
//
// start, start + step, start + 2*step, ... up to end (inclusive for to(),
// exclusive for until()). Descending when step is negative. The element
// count is fixed at construction; elements are computed on access as
// start + i * step, so iterating twice yields the same values.

template <Primitive P> class NumericRange {
  public:
    using value_type = P;
    using size_type = std::size_t;

    class iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = P;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = P;

        iterator() = default;
        iterator(const NumericRange* range, size_type index)
            : range_(range), index_(index) {}

        P operator*() const { return range_->element(index_); }

        iterator& operator++() {
            ++index_;
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            ++index_;
            return tmp;
        }

        bool operator==(const iterator& o) const {
            return range_ == o.range_ && index_ == o.index_;
        }

      private:
        const NumericRange* range_{nullptr};
        size_type index_{0};
    };

    using const_iterator = iterator;

    NumericRange(P start, P end, P step, bool inclusive)
        : start_(start), end_(end), step_(step), inclusive_(inclusive) {
        if (step == 0)
            throw std::invalid_argument("NumericRange: step cannot be 0");
        size_ = count();
    }

    P start() const noexcept { return start_; }
    P end_value() const noexcept { return end_; }
    P step() const noexcept { return step_; }
    bool is_inclusive() const noexcept { return inclusive_; }

    size_type size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    P operator[](size_type i) const {
        if (i >= size_)
            throw std::out_of_range("NumericRange: index out of range");
        return element(i);
    }

    P front() const { return (*this)[0]; }
    P back() const {
        if (size_ == 0)
            throw std::out_of_range("NumericRange: back() on an empty range");
        return element(size_ - 1);
    }

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, size_); }

    NumericRange by(P step) const {
        return NumericRange(start_, end_, step, inclusive_);
    }

    bool operator==(const NumericRange& o) const noexcept {
        return start_ == o.start_ && end_ == o.end_ && step_ == o.step_ &&
               inclusive_ == o.inclusive_;
    }

  private:
    P element(size_type i) const {
        if constexpr (std::floating_point<P>) {
            return static_cast<P>(start_ + static_cast<P>(i) * step_);
        } else {
            // modular arithmetic; the result is in range by construction
            const auto s = static_cast<std::uint64_t>(static_cast<std::int64_t>(start_));
            const auto st = static_cast<std::uint64_t>(static_cast<std::int64_t>(step_));
            return static_cast<P>(static_cast<std::int64_t>(s + i * st));
        }
    }

    size_type count() const {
        if constexpr (std::floating_point<P>) {
            if (!detail::is_finite(start_) || !detail::is_finite(end_) ||
                !detail::is_finite(step_))
                throw std::invalid_argument(
                    "NumericRange: floating bounds and step must be finite");
            const double q = (static_cast<double>(end_) - start_) / step_;
            if (q < 0)
                return 0;
            const double n = inclusive_ ? std::floor(q) + 1 : std::ceil(q);
            if (!(n < static_cast<double>(std::numeric_limits<size_type>::max())))
                throw std::invalid_argument("NumericRange: too many elements");
            return static_cast<size_type>(n);
        } else {
            const auto s = static_cast<std::int64_t>(start_);
            const auto e = static_cast<std::int64_t>(end_);
            const auto st = static_cast<std::int64_t>(step_);
            const bool ascending = st > 0;
            if (ascending ? s > e : s < e)
                return 0;
            if (s == e)
                return inclusive_ ? 1 : 0;
            std::uint64_t span = ascending
                                     ? static_cast<std::uint64_t>(e) - static_cast<std::uint64_t>(s)
                                     : static_cast<std::uint64_t>(s) - static_cast<std::uint64_t>(e);
            if (!inclusive_)
                span -= 1;
            const std::uint64_t mag = ascending
                                          ? static_cast<std::uint64_t>(st)
                                          : 0ULL - static_cast<std::uint64_t>(st);
            const std::uint64_t q = span / mag;
            if (q >= std::numeric_limits<size_type>::max())
                throw std::invalid_argument("NumericRange: too many elements");
            return static_cast<size_type>(q + 1);
        }
    }

    P start_;
    P end_;
    P step_;
    bool inclusive_;
    size_type size_{0};
};

} // namespace refnum

#endif // REFNUM_RANGE_HPP
