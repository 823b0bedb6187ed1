#include "unitgraph/rational.h"

#include <symengine/eval_double.h>
#include <symengine/integer.h>
#include <symengine/rational.h>
#include <symengine/symengine_exception.h>

namespace unitgraph {

bool is_rational(const SymEngine::Basic& value) {
    return SymEngine::is_a<SymEngine::Integer>(value) || SymEngine::is_a<SymEngine::Rational>(value);
}

Rational rational(long num, long den) {
    if (den == 0) {
        throw ShapeMismatch("rational with zero denominator");
    }
    return SymEngine::Rational::from_two_ints(*SymEngine::integer(num), *SymEngine::integer(den));
}

Rational to_rational(const Exact& value) {
    if (value.is_null() || !is_rational(*value)) {
        throw ShapeMismatch("expected an exact rational, got " + (value.is_null() ? std::string("null") : value->__str__()));
    }
    return SymEngine::rcp_static_cast<const SymEngine::Number>(value);
}

Rational add(const Rational& a, const Rational& b) {
    return a->add(*b);
}

Rational sub(const Rational& a, const Rational& b) {
    return a->sub(*b);
}

Rational mul(const Rational& a, const Rational& b) {
    return a->mul(*b);
}

Rational div(const Rational& a, const Rational& b) {
    if (b->is_zero()) {
        throw ShapeMismatch("division of " + a->__str__() + " by zero");
    }
    return a->div(*b);
}

Rational neg(const Rational& a) {
    return rational(0)->sub(*a);
}

bool rational_eq(const Rational& a, const Rational& b) {
    return SymEngine::eq(*a, *b);
}

bool is_zero(const Rational& a) {
    return a->is_zero();
}

bool is_one(const Rational& a) {
    return a->is_one();
}

double to_double(const SymEngine::Basic& value) {
    try {
        return SymEngine::eval_double(value);
    } catch (const SymEngine::SymEngineException& ex) {
        throw ShapeMismatch(std::string("not a numeric constant: ") + ex.what());
    }
}

std::string to_string(const SymEngine::Basic& value) {
    return value.__str__();
}

bool rationals_eq(const std::vector<Rational>& a, const std::vector<Rational>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!rational_eq(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

}
