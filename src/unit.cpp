#include "unitgraph/unit.h"

#include <algorithm>
#include <cctype>

namespace unitgraph {

Unit::Unit(std::string name, Dimension dimension, std::vector<std::string> aliases, Rational scale)
    : name_(std::move(name)),
      aliases_(std::move(aliases)),
      dimension_(std::move(dimension)),
      scale_(std::move(scale)) {
    if (name_.empty()) {
        throw ShapeMismatch("unit name must not be empty");
    }
    if (scale_.is_null() || !scale_->is_positive()) {
        throw ShapeMismatch("unit '" + name_ + "' needs a positive scale");
    }
    for (std::size_t i = 0; i < aliases_.size(); ++i) {
        if (aliases_[i].empty() || aliases_[i] == name_) {
            throw NameCollision("unit '" + name_ + "' has an invalid alias '" + aliases_[i] + "'");
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (aliases_[i] == aliases_[j]) {
                throw NameCollision("unit '" + name_ + "' repeats alias '" + aliases_[i] + "'");
            }
        }
    }
}

std::string Unit::qualified_name() const {
    return system_.empty() ? name_ : system_ + ":" + name_;
}

UnitSystem::UnitSystem(std::string name, BasisPtr basis, const std::map<std::string, Unit>& bases)
    : name_(std::move(name)), basis_(std::move(basis)) {
    if (name_.empty()) {
        throw ShapeMismatch("unit system name must not be empty");
    }
    if (!basis_) {
        throw ShapeMismatch("unit system '" + name_ + "' requires a basis");
    }
    if (bases.empty()) {
        throw ShapeMismatch("unit system '" + name_ + "' needs at least one base unit");
    }

    for (const auto& entry : bases) {
        if (!basis_->contains(entry.first)) {
            throw InvalidBaseUnit(
                "'" + entry.first + "' is not a component of basis '" + basis_->name() + "'");
        }
    }

    for (const auto& component : basis_->components()) {
        auto it = bases.find(component);
        if (it == bases.end()) continue;

        const Unit& unit = it->second;
        if (!same_basis(unit.dimension().basis(), basis_)) {
            throw InvalidBaseUnit(
                "'" + unit.name() + "' is not on basis '" + basis_->name() + "'");
        }
        std::size_t axis = 0;
        if (!unit.dimension().pure_axis(axis) || basis_->components()[axis] != component) {
            throw InvalidBaseUnit(
                "'" + unit.name() + "' has dimension " + unit.dimension().to_string() +
                ", not pure " + component);
        }
        if (!is_one(unit.scale())) {
            throw InvalidBaseUnit("'" + unit.name() + "' must anchor scale 1");
        }

        Unit stored = unit;
        stored.system_ = name_;
        stored.is_base_ = true;
        units_.push_back(stored);
        register_names(units_.back(), units_.size() - 1);
        bases_[component] = units_.size() - 1;
    }
}

void UnitSystem::register_names(const Unit& unit, std::size_t slot) {
    std::vector<std::string> keys(1, unit.name());
    keys.insert(keys.end(), unit.aliases().begin(), unit.aliases().end());
    for (const auto& key : keys) {
        if (names_.count(key)) {
            throw NameCollision("'" + key + "' is already used in system '" + name_ + "'");
        }
    }
    for (const auto& key : keys) {
        names_[key] = slot;
    }
}

const Unit& UnitSystem::add_unit(const Unit& unit) {
    if (!same_basis(unit.dimension().basis(), basis_)) {
        throw ShapeMismatch(
            "unit '" + unit.name() + "' is not on basis '" + basis_->name() + "' of system '" + name_ + "'");
    }
    Unit stored = unit;
    stored.system_ = name_;
    stored.is_base_ = false;
    register_names(stored, units_.size());
    units_.push_back(stored);
    return units_.back();
}

bool UnitSystem::covers(const std::string& component) const {
    return bases_.count(component) != 0;
}

const Unit& UnitSystem::base_for(const std::string& component) const {
    auto it = bases_.find(component);
    if (it == bases_.end()) {
        throw DimensionNotCovered("system '" + name_ + "' has no base unit for " + component);
    }
    return units_[it->second];
}

std::vector<std::string> UnitSystem::dimensions() const {
    std::vector<std::string> result;
    for (const auto& component : basis_->components()) {
        if (covers(component)) {
            result.push_back(component);
        }
    }
    return result;
}

namespace {

std::string lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}

const Unit* UnitSystem::find(const std::string& name_or_alias) const {
    auto it = names_.find(name_or_alias);
    if (it != names_.end()) {
        return &units_[it->second];
    }
    const std::string wanted = lowered(name_or_alias);
    for (const auto& entry : names_) {
        if (lowered(entry.first) == wanted) {
            return &units_[entry.second];
        }
    }
    return nullptr;
}

const Unit& UnitSystem::lookup(const std::string& name_or_alias) const {
    const Unit* unit = find(name_or_alias);
    if (unit == nullptr) {
        throw UnknownUnit("'" + name_or_alias + "' is not a unit of system '" + name_ + "'");
    }
    return *unit;
}

}
