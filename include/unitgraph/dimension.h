#pragma once

#include <memory>
#include <string>
#include <vector>

#include "errors.hpp"
#include "rational.h"

namespace unitgraph {

// Ordered set of base dimensions a family of unit systems agrees on.
class Basis {
public:
    Basis(std::string name, std::vector<std::string> components);

    // mass, length, time, charge, temperature, amount, luminous_intensity
    static std::shared_ptr<const Basis> standard();

    const std::string& name() const { return name_; }
    const std::vector<std::string>& components() const { return components_; }
    std::size_t size() const { return components_.size(); }

    bool contains(const std::string& component) const;
    std::size_t index(const std::string& component) const;

    bool operator==(const Basis& other) const {
        return name_ == other.name_ && components_ == other.components_;
    }

    bool operator!=(const Basis& other) const {
        return !(*this == other);
    }

private:
    std::string name_;
    std::vector<std::string> components_;
};

using BasisPtr = std::shared_ptr<const Basis>;

bool same_basis(const BasisPtr& a, const BasisPtr& b);

class Dimension {
public:
    explicit Dimension(BasisPtr basis);
    Dimension(BasisPtr basis, std::vector<Rational> exponents);

    static Dimension base(const BasisPtr& basis, const std::string& component);

    const BasisPtr& basis() const { return basis_; }
    const std::vector<Rational>& exponents() const { return exponents_; }
    const Rational& operator[](std::size_t i) const { return exponents_.at(i); }
    const Rational& exponent(const std::string& component) const;

    bool is_dimensionless() const;

    // True iff exactly one exponent is 1 and every other is 0.
    bool pure_axis(std::size_t& axis) const;

    bool operator==(const Dimension& other) const;

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    Dimension operator+(const Dimension& other) const;
    Dimension operator-(const Dimension& other) const;
    Dimension operator*(const Rational& scalar) const;

    std::string to_string() const;

private:
    BasisPtr basis_;
    std::vector<Rational> exponents_;
};

Dimension combine(const Dimension& a, const Dimension& b);
Dimension divide(const Dimension& a, const Dimension& b);
Dimension power(const Dimension& a, const Rational& n);
bool equals(const Dimension& a, const Dimension& b);

}
