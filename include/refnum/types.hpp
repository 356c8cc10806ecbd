#ifndef REFNUM_TYPES_HPP
#define REFNUM_TYPES_HPP

#include <refnum/catalog.hpp>
#include <refnum/refined.hpp>

namespace refnum {

// --- Concrete refinement types ---

using PosInt = Refined<bindings::PosInt>;
using PosZInt = Refined<bindings::PosZInt>;
using NegInt = Refined<bindings::NegInt>;
using NegZInt = Refined<bindings::NegZInt>;
using NonZeroInt = Refined<bindings::NonZeroInt>;
using PosLong = Refined<bindings::PosLong>;
using PosZLong = Refined<bindings::PosZLong>;
using NegLong = Refined<bindings::NegLong>;
using NegZLong = Refined<bindings::NegZLong>;
using NonZeroLong = Refined<bindings::NonZeroLong>;
using PosFloat = Refined<bindings::PosFloat>;
using PosZFloat = Refined<bindings::PosZFloat>;
using NegFloat = Refined<bindings::NegFloat>;
using NegZFloat = Refined<bindings::NegZFloat>;
using NonZeroFloat = Refined<bindings::NonZeroFloat>;
using FiniteFloat = Refined<bindings::FiniteFloat>;
using PosFiniteFloat = Refined<bindings::PosFiniteFloat>;
using PosZFiniteFloat = Refined<bindings::PosZFiniteFloat>;
using NegFiniteFloat = Refined<bindings::NegFiniteFloat>;
using NegZFiniteFloat = Refined<bindings::NegZFiniteFloat>;
using NonZeroFiniteFloat = Refined<bindings::NonZeroFiniteFloat>;
using PosDouble = Refined<bindings::PosDouble>;
using PosZDouble = Refined<bindings::PosZDouble>;
using NegDouble = Refined<bindings::NegDouble>;
using NegZDouble = Refined<bindings::NegZDouble>;
using NonZeroDouble = Refined<bindings::NonZeroDouble>;
using FiniteDouble = Refined<bindings::FiniteDouble>;
using PosFiniteDouble = Refined<bindings::PosFiniteDouble>;
using PosZFiniteDouble = Refined<bindings::PosZFiniteDouble>;
using NegFiniteDouble = Refined<bindings::NegFiniteDouble>;
using NegZFiniteDouble = Refined<bindings::NegZFiniteDouble>;
using NonZeroFiniteDouble = Refined<bindings::NonZeroFiniteDouble>;
using NumericChar = Refined<bindings::NumericChar>;

} // namespace refnum

#endif // REFNUM_TYPES_HPP
