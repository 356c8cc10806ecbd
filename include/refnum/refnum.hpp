#ifndef REFNUM_REFNUM_HPP
#define REFNUM_REFNUM_HPP

#include <refnum/primitive.hpp>
#include <refnum/predicate.hpp>
#include <refnum/binding.hpp>
#include <refnum/catalog.hpp>
#include <refnum/result.hpp>
#include <refnum/range.hpp>
#include <refnum/format.hpp>
#include <refnum/refined.hpp>
#include <refnum/operators.hpp>
#include <refnum/types.hpp>

#endif // REFNUM_REFNUM_HPP
