#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "basis_transform.h"
#include "errors.hpp"
#include "map.h"
#include "unit.h"

namespace unitgraph {

// One known conversion between a base-dimension unit of one system and its
// counterpart in another. Either direction is accepted by connect_systems.
struct Calibration {
    Unit src;
    Unit dst;
    Map map;
};

// Registry of unit-to-unit maps and the path search over them.
//
// Units are stored once in an arena and edges refer to them by index. Every
// registration stores the map and its inverse. convert() picks the path with
// the fewest edges; ties go to the edge registered first.
class ConversionGraph {
public:
    void add_edge(const Unit& src, const Unit& dst, const Map& map);
    void add_edge(const Unit& src, const Unit& dst, const Map& map, const BasisTransform& transform);

    // Derives an edge for every pair (u in src_system, w in dst_system) whose
    // dimensions correspond under the transform. Registers all or nothing.
    void connect_systems(const BasisTransform& transform,
                         const UnitSystem& src_system,
                         const UnitSystem& dst_system,
                         const std::vector<Calibration>& calibrations);

    // Records the system's base units so that units of the system with no
    // direct path can still be converted factor by factor through them.
    void register_system(const UnitSystem& system);
    bool has_system(const std::string& name) const { return system_bases_.count(name) != 0; }

    // Follows the shortest edge path. Units of registered systems with no
    // such path fall back to per-dimension conversion of their base units.
    Map convert(const Unit& src, const Unit& dst) const;
    // Units along the edge path chosen by convert(). No factorwise fallback.
    std::vector<Unit> conversion_path(const Unit& src, const Unit& dst) const;

    bool has_unit(const Unit& unit) const;
    bool has_edge(const Unit& src, const Unit& dst) const;
    std::size_t unit_count() const { return units_.size(); }
    std::size_t edge_count() const;

    const std::vector<BasisTransform>& transforms() const { return transforms_; }
    std::vector<std::pair<Unit, Unit>> edges_for_transform(const BasisTransform& transform) const;

    // Ends the setup phase. Every later mutation fails with GraphFrozen.
    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

private:
    using NodeId = std::size_t;
    using UnitKey = std::pair<std::string, std::string>;

    struct Edge {
        NodeId to;
        Map map;
    };

    static UnitKey key_of(const Unit& unit);

    void require_mutable(const char* operation) const;
    bool find_node(const Unit& unit, NodeId& id) const;
    // Like find_node, but only matches a node stored with the same definition.
    bool find_registered(const Unit& unit, NodeId& id) const;
    NodeId intern(const Unit& unit);
    const Edge* find_edge(NodeId from, NodeId to) const;

    // Throws DuplicateEdge if the pair already carries a different map in either direction.
    void check_conflict(const Unit& src, const Unit& dst, const Map& map) const;
    // Returns false when an identical edge was already present.
    bool insert_edge(const Unit& src, const Unit& dst, const Map& map);
    std::size_t record_transform(const BasisTransform& transform);
    // Throws NameCollision if the system's name or base units clash with what is registered.
    void check_system(const UnitSystem& system) const;
    void store_system(const UnitSystem& system);

    void require_related(const Unit& src, const Unit& dst) const;
    bool dimensions_related(const Dimension& src, const Dimension& dst) const;
    std::vector<NodeId> search(NodeId src, NodeId dst) const;
    // Empty when either unit is unknown or the two are not connected.
    std::vector<NodeId> path_between(const Unit& src, const Unit& dst) const;
    Map compose_path(const std::vector<NodeId>& path) const;
    bool factorwise(const Unit& src, const Unit& dst, Map& result) const;

    std::vector<Unit> units_;
    std::map<UnitKey, NodeId> index_;
    std::vector<std::vector<Edge>> adjacency_;
    std::vector<BasisTransform> transforms_;
    // Inverses of the invertible entries of transforms_.
    std::vector<BasisTransform> inverses_;
    // System name -> base unit per basis component.
    std::map<std::string, std::map<std::string, Unit>> system_bases_;
    std::vector<std::vector<std::pair<NodeId, NodeId>>> transform_edges_;
    bool frozen_ = false;
};

}
