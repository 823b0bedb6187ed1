#include "unitgraph/basis_transform.h"

#include <symengine/matrix.h>
#include <symengine/symengine_exception.h>

#include <sstream>

namespace unitgraph {

namespace {

std::vector<std::size_t> resolve(const BasisPtr& basis, const std::vector<std::string>& names, const char* side) {
    if (!basis) {
        throw ShapeMismatch(std::string("transform ") + side + " basis is missing");
    }
    std::vector<std::size_t> indices;
    indices.reserve(names.size());
    for (const auto& name : names) {
        const std::size_t i = basis->index(name);
        for (std::size_t seen : indices) {
            if (seen == i) {
                throw ShapeMismatch(std::string(side) + " dimension '" + name + "' is listed twice");
            }
        }
        indices.push_back(i);
    }
    return indices;
}

SymEngine::DenseMatrix to_dense(const RationalMatrix& m) {
    const unsigned n = static_cast<unsigned>(m.size());
    SymEngine::vec_basic entries;
    entries.reserve(n * n);
    for (const auto& row : m) {
        for (const auto& value : row) {
            entries.push_back(value);
        }
    }
    return SymEngine::DenseMatrix(n, n, entries);
}

Rational exact_determinant(const RationalMatrix& m) {
    try {
        return to_rational(to_dense(m).det());
    } catch (const SymEngine::SymEngineException& ex) {
        throw NonInvertibleTransform(std::string("determinant failed: ") + ex.what());
    }
}

RationalMatrix minor_of(const RationalMatrix& m, std::size_t skip_row, std::size_t skip_col) {
    RationalMatrix result;
    for (std::size_t i = 0; i < m.size(); ++i) {
        if (i == skip_row) continue;
        std::vector<Rational> row;
        for (std::size_t j = 0; j < m[i].size(); ++j) {
            if (j == skip_col) continue;
            row.push_back(m[i][j]);
        }
        result.push_back(row);
    }
    return result;
}

// inverse = adj(M) / det(M), adj(M)[i][j] = (-1)^(i+j) * det(minor(M, j, i))
RationalMatrix adjugate_inverse(const RationalMatrix& m, const Rational& det) {
    const std::size_t n = m.size();
    RationalMatrix inverse(n, std::vector<Rational>(n));
    if (n == 1) {
        inverse[0][0] = div(rational(1), det);
        return inverse;
    }
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            Rational cofactor = exact_determinant(minor_of(m, j, i));
            if ((i + j) % 2 == 1) {
                cofactor = neg(cofactor);
            }
            inverse[i][j] = div(cofactor, det);
        }
    }
    return inverse;
}

}

BasisTransform::BasisTransform(BasisPtr src, BasisPtr dst,
                               std::vector<std::string> src_dimensions,
                               std::vector<std::string> dst_dimensions,
                               RationalMatrix matrix)
    : src_(std::move(src)),
      dst_(std::move(dst)),
      src_dimensions_(std::move(src_dimensions)),
      dst_dimensions_(std::move(dst_dimensions)),
      matrix_(std::move(matrix)) {
    src_index_ = resolve(src_, src_dimensions_, "source");
    dst_index_ = resolve(dst_, dst_dimensions_, "destination");

    if (src_dimensions_.empty() || dst_dimensions_.empty()) {
        throw ShapeMismatch("transform needs at least one source and one destination dimension");
    }
    if (matrix_.size() != dst_dimensions_.size()) {
        throw ShapeMismatch(
            "matrix has " + std::to_string(matrix_.size()) + " rows for " +
            std::to_string(dst_dimensions_.size()) + " destination dimensions");
    }
    for (const auto& row : matrix_) {
        if (row.size() != src_dimensions_.size()) {
            throw ShapeMismatch(
                "matrix row has " + std::to_string(row.size()) + " columns for " +
                std::to_string(src_dimensions_.size()) + " source dimensions");
        }
        for (const auto& value : row) {
            if (value.is_null()) {
                throw ShapeMismatch("matrix entry is missing");
            }
        }
    }

    if (is_square()) {
        determinant_ = exact_determinant(matrix_);
        invertible_ = !is_zero(determinant_);
    }
}

const Rational& BasisTransform::determinant() const {
    if (!is_square()) {
        throw NonInvertibleTransform(
            "determinant of a " + std::to_string(dst_dimensions_.size()) + "x" +
            std::to_string(src_dimensions_.size()) + " matrix");
    }
    return determinant_;
}

BasisTransform BasisTransform::invert() const {
    if (!is_square()) {
        throw NonInvertibleTransform("matrix of " + to_string() + " is not square");
    }
    if (!invertible_) {
        throw NonInvertibleTransform("determinant of " + to_string() + " is zero");
    }
    return BasisTransform(dst_, src_, dst_dimensions_, src_dimensions_,
                          adjugate_inverse(matrix_, determinant_));
}

Dimension BasisTransform::apply_to_dimension(const Dimension& dimension) const {
    if (!same_basis(dimension.basis(), src_)) {
        throw ShapeMismatch(
            "dimension on basis '" + dimension.basis()->name() + "' given to transform from '" +
            src_->name() + "'");
    }
    for (std::size_t k = 0; k < src_->size(); ++k) {
        bool mapped = false;
        for (std::size_t i : src_index_) {
            if (i == k) mapped = true;
        }
        if (!mapped && !is_zero(dimension[k])) {
            throw DimensionMismatch(
                dimension.to_string() + " is not representable: '" + src_->components()[k] +
                "' is outside the transform");
        }
    }

    std::vector<Rational> result(dst_->size(), rational(0));
    for (std::size_t r = 0; r < dst_index_.size(); ++r) {
        Rational sum = rational(0);
        for (std::size_t c = 0; c < src_index_.size(); ++c) {
            sum = add(sum, mul(matrix_[r][c], dimension[src_index_[c]]));
        }
        result[dst_index_[r]] = sum;
    }
    return Dimension(dst_, std::move(result));
}

bool BasisTransform::maps(const Dimension& from, const Dimension& to) const {
    if (!same_basis(from.basis(), src_) || !same_basis(to.basis(), dst_)) {
        return false;
    }
    try {
        return apply_to_dimension(from) == to;
    } catch (const DimensionMismatch&) {
        return false;
    }
}

bool BasisTransform::validate_edge(const Unit& src, const Unit& dst) const {
    return maps(src.dimension(), dst.dimension());
}

bool BasisTransform::operator==(const BasisTransform& other) const {
    if (!same_basis(src_, other.src_) || !same_basis(dst_, other.dst_)) return false;
    if (src_dimensions_ != other.src_dimensions_ || dst_dimensions_ != other.dst_dimensions_) return false;
    for (std::size_t r = 0; r < matrix_.size(); ++r) {
        if (!rationals_eq(matrix_[r], other.matrix_[r])) return false;
    }
    return true;
}

std::string BasisTransform::to_string() const {
    std::ostringstream oss;
    oss << "BasisTransform(" << src_->name() << " -> " << dst_->name() << ", [";
    for (std::size_t r = 0; r < matrix_.size(); ++r) {
        if (r > 0) oss << ", ";
        oss << "[";
        for (std::size_t c = 0; c < matrix_[r].size(); ++c) {
            if (c > 0) oss << ", ";
            oss << matrix_[r][c]->__str__();
        }
        oss << "]";
    }
    oss << "])";
    return oss.str();
}

}
