#include "unitgraph/map.h"

#include <symengine/add.h>
#include <symengine/constants.h>
#include <symengine/mul.h>
#include <symengine/pow.h>
#include <symengine/symengine_exception.h>
#include <symengine/test_visitors.h>
#include <symengine/visitor.h>

namespace unitgraph {

namespace {

using SymEngine::Basic;
using SymEngine::RCP;

bool exactly_equal(const Exact& a, const Exact& b) {
    if (SymEngine::eq(*a, *b)) {
        return true;
    }
    const auto difference = SymEngine::expand(SymEngine::sub(a, b));
    return SymEngine::is_zero(*difference) == SymEngine::tribool::tritrue;
}

Exact require_constant(const Exact& value, const char* role) {
    if (value.is_null()) {
        throw ShapeMismatch(std::string("map ") + role + " is missing");
    }
    if (!SymEngine::free_symbols(*value).empty()) {
        throw ShapeMismatch(std::string("map ") + role + " is not a numeric constant: " + value->__str__());
    }
    return value;
}

}

Map::Map(Exact scale, Exact offset)
    : scale_(require_constant(scale, "scale")),
      offset_(require_constant(offset, "offset")),
      scale_value_(to_double(*scale_)),
      offset_value_(to_double(*offset_)) {}

Map Map::identity() {
    return Map(SymEngine::one, SymEngine::zero);
}

Map Map::linear(const Exact& scale) {
    return Map(scale, SymEngine::zero);
}

Map Map::affine(const Exact& scale, const Exact& offset) {
    return Map(scale, offset);
}

double Map::apply(double value) const {
    return scale_value_ * value + offset_value_;
}

Exact Map::apply(const Exact& value) const {
    require_constant(value, "argument");
    return SymEngine::expand(SymEngine::add(SymEngine::mul(scale_, value), offset_));
}

Map Map::compose(const Map& other) const {
    // a1 * (a2*x + b2) + b1 = (a1*a2)*x + (a1*b2 + b1)
    return Map(SymEngine::expand(SymEngine::mul(scale_, other.scale_)),
               SymEngine::expand(SymEngine::add(SymEngine::mul(scale_, other.offset_), offset_)));
}

bool Map::is_invertible() const {
    return SymEngine::is_zero(*scale_) != SymEngine::tribool::tritrue;
}

Map Map::invert() const {
    if (!is_invertible()) {
        throw NonInvertibleMap("scale is zero in " + to_string());
    }
    const auto inverse_scale = SymEngine::div(SymEngine::one, scale_);
    return Map(inverse_scale, SymEngine::expand(SymEngine::neg(SymEngine::mul(offset_, inverse_scale))));
}

Map Map::power(const Rational& exponent) const {
    if (is_one(exponent)) {
        return *this;
    }
    if (rational_eq(exponent, rational(-1))) {
        return invert();
    }
    if (!is_linear()) {
        throw InvalidExponent("affine " + to_string() + " only supports exponents 1 and -1, got " +
                              exponent->__str__());
    }
    if (exponent->is_negative() && !is_invertible()) {
        throw NonInvertibleMap("cannot raise " + to_string() + " to a negative power");
    }
    try {
        return Map(SymEngine::pow(scale_, exponent), SymEngine::zero);
    } catch (const SymEngine::SymEngineException& ex) {
        throw InvalidExponent(std::string("cannot raise ") + to_string() + ": " + ex.what());
    }
}

bool Map::is_linear() const {
    return SymEngine::is_zero(*offset_) == SymEngine::tribool::tritrue;
}

bool Map::is_identity() const {
    return is_linear() && exactly_equal(scale_, SymEngine::one);
}

bool Map::operator==(const Map& other) const {
    return exactly_equal(scale_, other.scale_) && exactly_equal(offset_, other.offset_);
}

std::string Map::to_string() const {
    if (is_linear()) {
        return "Map(" + scale_->__str__() + ")";
    }
    return "Map(" + scale_->__str__() + ", " + offset_->__str__() + ")";
}

}
