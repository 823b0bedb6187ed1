#pragma once

#include <string>
#include <vector>

#include "dimension.h"
#include "errors.hpp"
#include "rational.h"
#include "unit.h"

namespace unitgraph {

using RationalMatrix = std::vector<std::vector<Rational>>;

// dst exponents = M * src exponents, M has one row per destination dimension
// and one column per source dimension.
class BasisTransform {
public:
    BasisTransform(BasisPtr src, BasisPtr dst,
                   std::vector<std::string> src_dimensions,
                   std::vector<std::string> dst_dimensions,
                   RationalMatrix matrix);

    const BasisPtr& src() const { return src_; }
    const BasisPtr& dst() const { return dst_; }
    const std::vector<std::string>& src_dimensions() const { return src_dimensions_; }
    const std::vector<std::string>& dst_dimensions() const { return dst_dimensions_; }
    const RationalMatrix& matrix() const { return matrix_; }

    bool is_square() const { return src_dimensions_.size() == dst_dimensions_.size(); }
    bool is_invertible() const { return invertible_; }
    const Rational& determinant() const;

    BasisTransform invert() const;

    Dimension apply_to_dimension(const Dimension& dimension) const;

    // False when src's dimension is not representable or maps elsewhere.
    bool validate_edge(const Unit& src, const Unit& dst) const;
    bool maps(const Dimension& from, const Dimension& to) const;

    bool operator==(const BasisTransform& other) const;

    bool operator!=(const BasisTransform& other) const {
        return !(*this == other);
    }

    std::string to_string() const;

private:
    BasisPtr src_;
    BasisPtr dst_;
    std::vector<std::string> src_dimensions_;
    std::vector<std::string> dst_dimensions_;
    std::vector<std::size_t> src_index_;
    std::vector<std::size_t> dst_index_;
    RationalMatrix matrix_;
    Rational determinant_;
    bool invertible_ = false;
};

}
