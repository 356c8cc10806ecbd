#ifndef REFNUM_CATALOG_HPP
#define REFNUM_CATALOG_HPP

#include <cstddef>
#include <iterator>
#include <string_view>

#include <refnum/binding.hpp>
#include <refnum/predicate.hpp>
#include <refnum/primitive.hpp>

namespace refnum {

// --- Bindings of the concrete refinement types ---

namespace bindings {

using dsl::finite;
using dsl::v;
using K = PrimitiveKind;

inline constexpr Binding PosInt{"PosInt", K::Int, v > 0};
inline constexpr Binding PosZInt{"PosZInt", K::Int, v >= 0};
inline constexpr Binding NegInt{"NegInt", K::Int, v < 0};
inline constexpr Binding NegZInt{"NegZInt", K::Int, v <= 0};
inline constexpr Binding NonZeroInt{"NonZeroInt", K::Int, v != 0};

inline constexpr Binding PosLong{"PosLong", K::Long, v > 0};
inline constexpr Binding PosZLong{"PosZLong", K::Long, v >= 0};
inline constexpr Binding NegLong{"NegLong", K::Long, v < 0};
inline constexpr Binding NegZLong{"NegZLong", K::Long, v <= 0};
inline constexpr Binding NonZeroLong{"NonZeroLong", K::Long, v != 0};

inline constexpr Binding PosFloat{"PosFloat", K::Float, v > 0};
inline constexpr Binding PosZFloat{"PosZFloat", K::Float, v >= 0};
inline constexpr Binding NegFloat{"NegFloat", K::Float, v < 0};
inline constexpr Binding NegZFloat{"NegZFloat", K::Float, v <= 0};
inline constexpr Binding NonZeroFloat{"NonZeroFloat", K::Float, v != 0};
inline constexpr Binding FiniteFloat{"FiniteFloat", K::Float, finite(v)};
inline constexpr Binding PosFiniteFloat{"PosFiniteFloat", K::Float, v > 0 && finite(v)};
inline constexpr Binding PosZFiniteFloat{"PosZFiniteFloat", K::Float, v >= 0 && finite(v)};
inline constexpr Binding NegFiniteFloat{"NegFiniteFloat", K::Float, v < 0 && finite(v)};
inline constexpr Binding NegZFiniteFloat{"NegZFiniteFloat", K::Float, v <= 0 && finite(v)};
inline constexpr Binding NonZeroFiniteFloat{"NonZeroFiniteFloat", K::Float, v != 0 && finite(v)};

inline constexpr Binding PosDouble{"PosDouble", K::Double, v > 0};
inline constexpr Binding PosZDouble{"PosZDouble", K::Double, v >= 0};
inline constexpr Binding NegDouble{"NegDouble", K::Double, v < 0};
inline constexpr Binding NegZDouble{"NegZDouble", K::Double, v <= 0};
inline constexpr Binding NonZeroDouble{"NonZeroDouble", K::Double, v != 0};
inline constexpr Binding FiniteDouble{"FiniteDouble", K::Double, finite(v)};
inline constexpr Binding PosFiniteDouble{"PosFiniteDouble", K::Double, v > 0 && finite(v)};
inline constexpr Binding PosZFiniteDouble{"PosZFiniteDouble", K::Double, v >= 0 && finite(v)};
inline constexpr Binding NegFiniteDouble{"NegFiniteDouble", K::Double, v < 0 && finite(v)};
inline constexpr Binding NegZFiniteDouble{"NegZFiniteDouble", K::Double, v <= 0 && finite(v)};
inline constexpr Binding NonZeroFiniteDouble{"NonZeroFiniteDouble", K::Double, v != 0 && finite(v)};

inline constexpr Binding NumericChar{"NumericChar", K::Char, v >= '0' && v <= '9'};

} // namespace bindings

// Every binding the library ships. Derived result types (round, floor,
// to_radians, ...) are looked up here.
inline constexpr Binding Catalog[] = {
    bindings::PosInt,          bindings::PosZInt,
    bindings::NegInt,          bindings::NegZInt,
    bindings::NonZeroInt,      bindings::PosLong,
    bindings::PosZLong,        bindings::NegLong,
    bindings::NegZLong,        bindings::NonZeroLong,
    bindings::PosFloat,        bindings::PosZFloat,
    bindings::NegFloat,        bindings::NegZFloat,
    bindings::NonZeroFloat,    bindings::FiniteFloat,
    bindings::PosFiniteFloat,  bindings::PosZFiniteFloat,
    bindings::NegFiniteFloat,  bindings::NegZFiniteFloat,
    bindings::NonZeroFiniteFloat, bindings::PosDouble,
    bindings::PosZDouble,      bindings::NegDouble,
    bindings::NegZDouble,      bindings::NonZeroDouble,
    bindings::FiniteDouble,    bindings::PosFiniteDouble,
    bindings::PosZFiniteDouble, bindings::NegFiniteDouble,
    bindings::NegZFiniteDouble, bindings::NonZeroFiniteDouble,
    bindings::NumericChar,
};

inline constexpr std::size_t CatalogSize = std::size(Catalog);

consteval bool in_catalog(PrimitiveKind kind, const Predicate& pred) {
    for (const auto& b : Catalog)
        if (b.kind == kind && b.pred == pred)
            return true;
    return false;
}

consteval Binding find_binding(PrimitiveKind kind, const Predicate& pred) {
    for (const auto& b : Catalog)
        if (b.kind == kind && b.pred == pred)
            return b;
    report_error("no catalog binding for derived predicate",
                 TypeName{kind_name(kind)}, pred.describe().data);
    return Binding{};
}

consteval Binding find_binding(std::string_view name) {
    for (const auto& b : Catalog)
        if (b.name.view() == name)
            return b;
    throw "no catalog binding with this name";
}

// --- Widening targets ---

constexpr bool widens(const Binding& from, const Binding& to) noexcept {
    return implies(from.kind, from.pred, to.kind, to.pred);
}

struct NameList {
    TypeName names[CatalogSize]{};
    std::size_t count{0};

    consteval bool contains(std::string_view name) const {
        for (std::size_t i = 0; i < count; ++i)
            if (names[i].view() == name)
                return true;
        return false;
    }
};

// Catalog types `b` converts to implicitly, in catalog order, itself excluded.
consteval NameList widening_targets(const Binding& b) {
    NameList out{};
    for (const auto& other : Catalog)
        if (!(other == b) && widens(b, other))
            out.names[out.count++] = other.name;
    return out;
}

} // namespace refnum

#endif // REFNUM_CATALOG_HPP
