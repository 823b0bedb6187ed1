#include "unitgraph/dimension.h"

#include <sstream>

namespace unitgraph {

Basis::Basis(std::string name, std::vector<std::string> components)
    : name_(std::move(name)), components_(std::move(components)) {
    if (name_.empty()) {
        throw ShapeMismatch("basis name must not be empty");
    }
    if (components_.empty()) {
        throw ShapeMismatch("basis '" + name_ + "' has no components");
    }
    for (std::size_t i = 0; i < components_.size(); ++i) {
        if (components_[i].empty()) {
            throw ShapeMismatch("basis '" + name_ + "' has an unnamed component");
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (components_[i] == components_[j]) {
                throw ShapeMismatch("basis '" + name_ + "' repeats component '" + components_[i] + "'");
            }
        }
    }
}

std::shared_ptr<const Basis> Basis::standard() {
    static const auto basis = std::make_shared<const Basis>(
        "standard",
        std::vector<std::string>{
            "mass", "length", "time", "charge", "temperature", "amount", "luminous_intensity"});
    return basis;
}

bool Basis::contains(const std::string& component) const {
    for (const auto& c : components_) {
        if (c == component) return true;
    }
    return false;
}

std::size_t Basis::index(const std::string& component) const {
    for (std::size_t i = 0; i < components_.size(); ++i) {
        if (components_[i] == component) return i;
    }
    throw ShapeMismatch("'" + component + "' is not a component of basis '" + name_ + "'");
}

bool same_basis(const BasisPtr& a, const BasisPtr& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return *a == *b;
}

Dimension::Dimension(BasisPtr basis) : basis_(std::move(basis)) {
    if (!basis_) {
        throw ShapeMismatch("dimension requires a basis");
    }
    exponents_.assign(basis_->size(), rational(0));
}

Dimension::Dimension(BasisPtr basis, std::vector<Rational> exponents)
    : basis_(std::move(basis)), exponents_(std::move(exponents)) {
    if (!basis_) {
        throw ShapeMismatch("dimension requires a basis");
    }
    if (exponents_.size() != basis_->size()) {
        throw ShapeMismatch(
            "dimension has " + std::to_string(exponents_.size()) + " exponents but basis '" +
            basis_->name() + "' has " + std::to_string(basis_->size()) + " components");
    }
    for (const auto& e : exponents_) {
        if (e.is_null()) {
            throw ShapeMismatch("dimension exponent is missing");
        }
    }
}

Dimension Dimension::base(const BasisPtr& basis, const std::string& component) {
    Dimension result(basis);
    result.exponents_[basis->index(component)] = rational(1);
    return result;
}

const Rational& Dimension::exponent(const std::string& component) const {
    return exponents_[basis_->index(component)];
}

bool Dimension::is_dimensionless() const {
    for (const auto& e : exponents_) {
        if (!is_zero(e)) return false;
    }
    return true;
}

bool Dimension::pure_axis(std::size_t& axis) const {
    bool found = false;
    for (std::size_t i = 0; i < exponents_.size(); ++i) {
        if (is_zero(exponents_[i])) continue;
        if (found || !is_one(exponents_[i])) return false;
        found = true;
        axis = i;
    }
    return found;
}

bool Dimension::operator==(const Dimension& other) const {
    return same_basis(basis_, other.basis_) && rationals_eq(exponents_, other.exponents_);
}

namespace {

void require_same_basis(const Dimension& a, const Dimension& b, const char* op) {
    if (!same_basis(a.basis(), b.basis())) {
        throw ShapeMismatch(
            std::string("cannot ") + op + " dimensions on bases '" + a.basis()->name() +
            "' and '" + b.basis()->name() + "'");
    }
}

}

Dimension Dimension::operator+(const Dimension& other) const {
    require_same_basis(*this, other, "combine");
    std::vector<Rational> result(exponents_.size());
    for (std::size_t i = 0; i < exponents_.size(); ++i) {
        result[i] = add(exponents_[i], other.exponents_[i]);
    }
    return Dimension(basis_, std::move(result));
}

Dimension Dimension::operator-(const Dimension& other) const {
    require_same_basis(*this, other, "divide");
    std::vector<Rational> result(exponents_.size());
    for (std::size_t i = 0; i < exponents_.size(); ++i) {
        result[i] = sub(exponents_[i], other.exponents_[i]);
    }
    return Dimension(basis_, std::move(result));
}

Dimension Dimension::operator*(const Rational& scalar) const {
    std::vector<Rational> result(exponents_.size());
    for (std::size_t i = 0; i < exponents_.size(); ++i) {
        result[i] = mul(exponents_[i], scalar);
    }
    return Dimension(basis_, std::move(result));
}

std::string Dimension::to_string() const {
    if (is_dimensionless()) {
        return "dimensionless";
    }

    std::ostringstream oss;
    bool first = true;

    auto append_dim = [&](const std::string& name, const Rational& power) {
        if (!is_zero(power)) {
            if (!first) oss << " ";
            first = false;
            oss << name;
            if (!is_one(power)) {
                oss << "^" << power->__str__();
            }
        }
    };

    for (std::size_t i = 0; i < exponents_.size(); ++i) {
        append_dim(basis_->components()[i], exponents_[i]);
    }

    return oss.str();
}

Dimension combine(const Dimension& a, const Dimension& b) {
    return a + b;
}

Dimension divide(const Dimension& a, const Dimension& b) {
    return a - b;
}

Dimension power(const Dimension& a, const Rational& n) {
    return a * n;
}

bool equals(const Dimension& a, const Dimension& b) {
    return a == b;
}

}
