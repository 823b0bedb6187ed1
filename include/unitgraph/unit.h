#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "dimension.h"
#include "errors.hpp"
#include "rational.h"

namespace unitgraph {

class UnitSystem;

// Immutable named scale for one dimension. Identity is (system, name).
class Unit {
public:
    Unit(std::string name, Dimension dimension, std::vector<std::string> aliases = {},
         Rational scale = rational(1));

    const std::string& name() const { return name_; }
    const std::vector<std::string>& aliases() const { return aliases_; }
    const Dimension& dimension() const { return dimension_; }

    // Size relative to the coherent product of the owning system's base units.
    const Rational& scale() const { return scale_; }

    // Empty for units not registered in any system.
    const std::string& system() const { return system_; }
    bool is_base() const { return is_base_; }

    bool same_identity(const Unit& other) const {
        return system_ == other.system_ && name_ == other.name_;
    }

    bool operator==(const Unit& other) const {
        return same_identity(other) && dimension_ == other.dimension_ && rational_eq(scale_, other.scale_);
    }

    bool operator!=(const Unit& other) const {
        return !(*this == other);
    }

    // "system:name", or just the name for a free-standing unit.
    std::string qualified_name() const;

private:
    friend class UnitSystem;

    std::string name_;
    std::vector<std::string> aliases_;
    Dimension dimension_;
    Rational scale_;
    std::string system_;
    bool is_base_ = false;
};

class UnitSystem {
public:
    UnitSystem(std::string name, BasisPtr basis, const std::map<std::string, Unit>& bases);

    const std::string& name() const { return name_; }
    const BasisPtr& basis() const { return basis_; }

    const Unit& add_unit(const Unit& unit);

    bool covers(const std::string& component) const;
    const Unit& base_for(const std::string& component) const;
    std::vector<std::string> dimensions() const;

    const Unit* find(const std::string& name_or_alias) const;
    const Unit& lookup(const std::string& name_or_alias) const;

    // Base units first (basis order), then derived units in registration order.
    // References into the registry stay valid across later add_unit calls.
    const std::deque<Unit>& units() const { return units_; }

private:
    void register_names(const Unit& unit, std::size_t slot);

    std::string name_;
    BasisPtr basis_;
    std::deque<Unit> units_;
    std::map<std::string, std::size_t> bases_;
    std::map<std::string, std::size_t> names_;
};

}
