#pragma once

#include <string>
#include <vector>

#include <symengine/basic.h>
#include <symengine/number.h>

#include "errors.hpp"

namespace unitgraph {

// Exact rational scalar. Always holds a canonical SymEngine Integer or Rational.
using Rational = SymEngine::RCP<const SymEngine::Number>;

// Exact numeric constant, possibly irrational (e.g. a surd from a fractional power).
using Exact = SymEngine::RCP<const SymEngine::Basic>;

Rational rational(long num, long den = 1);
Rational to_rational(const Exact& value);
bool is_rational(const SymEngine::Basic& value);

Rational add(const Rational& a, const Rational& b);
Rational sub(const Rational& a, const Rational& b);
Rational mul(const Rational& a, const Rational& b);
Rational div(const Rational& a, const Rational& b);
Rational neg(const Rational& a);

bool rational_eq(const Rational& a, const Rational& b);
bool is_zero(const Rational& a);
bool is_one(const Rational& a);

double to_double(const SymEngine::Basic& value);
std::string to_string(const SymEngine::Basic& value);

bool rationals_eq(const std::vector<Rational>& a, const std::vector<Rational>& b);

}
