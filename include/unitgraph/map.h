#pragma once

#include <string>

#include "errors.hpp"
#include "rational.h"

namespace unitgraph {

// y = scale * x + offset, with exact SymEngine coefficients.
class Map {
public:
    static Map identity();
    static Map linear(const Exact& scale);
    static Map affine(const Exact& scale, const Exact& offset);

    const Exact& scale() const { return scale_; }
    const Exact& offset() const { return offset_; }

    double apply(double value) const;
    Exact apply(const Exact& value) const;

    // (*this)(other(x)): other is applied first.
    Map compose(const Map& other) const;
    Map operator*(const Map& other) const { return compose(other); }

    Map invert() const;
    Map power(const Rational& exponent) const;

    bool is_linear() const;
    bool is_identity() const;
    bool is_invertible() const;

    bool operator==(const Map& other) const;

    bool operator!=(const Map& other) const {
        return !(*this == other);
    }

    std::string to_string() const;

private:
    Map(Exact scale, Exact offset);

    Exact scale_;
    Exact offset_;
    double scale_value_;
    double offset_value_;
};

}
