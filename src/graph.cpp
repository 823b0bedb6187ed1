#include "unitgraph/graph.h"
#include "unitgraph/logging.h"

#include <spdlog/spdlog.h>

#include <deque>
#include <limits>

namespace unitgraph {

namespace {

constexpr std::size_t no_node = std::numeric_limits<std::size_t>::max();

struct Staged {
    Unit src;
    Unit dst;
    Map map;
};

// Appends src -> dst unless the pair (or its reverse) is already staged.
void stage(std::vector<Staged>& pending, const Unit& src, const Unit& dst, const Map& map) {
    if (src.same_identity(dst)) {
        if (!map.is_identity()) {
            throw DuplicateEdge("derived self-conversion of " + src.qualified_name() + " is " + map.to_string());
        }
        return;
    }
    const Map inverse = map.invert();
    for (const auto& p : pending) {
        if (p.src.same_identity(src) && p.dst.same_identity(dst)) {
            if (p.map != map) {
                throw DuplicateEdge(
                    src.qualified_name() + " -> " + dst.qualified_name() + " derived as both " +
                    p.map.to_string() + " and " + map.to_string());
            }
            return;
        }
        if (p.src.same_identity(dst) && p.dst.same_identity(src)) {
            if (p.map != inverse) {
                throw DuplicateEdge(
                    src.qualified_name() + " <-> " + dst.qualified_name() + " derived inconsistently");
            }
            return;
        }
    }
    pending.push_back(Staged{src, dst, map});
}

std::vector<std::size_t> axes_of(const BasisTransform& transform) {
    std::vector<std::size_t> axes;
    for (const auto& name : transform.src_dimensions()) {
        axes.push_back(transform.src()->index(name));
    }
    return axes;
}

// True when a is a pure source dimension of the transform and b lies on its image.
bool calibrates(const BasisTransform& transform, const std::vector<std::size_t>& axes,
                const Unit& a, const Unit& b, std::size_t& slot) {
    std::size_t axis = 0;
    if (!same_basis(a.dimension().basis(), transform.src()) || !a.dimension().pure_axis(axis)) {
        return false;
    }
    for (std::size_t i = 0; i < axes.size(); ++i) {
        if (axes[i] != axis) continue;
        slot = i;
        return transform.validate_edge(a, b);
    }
    return false;
}

}

ConversionGraph::UnitKey ConversionGraph::key_of(const Unit& unit) {
    return UnitKey(unit.system(), unit.name());
}

void ConversionGraph::require_mutable(const char* operation) const {
    if (frozen_) {
        logger()->warn("{} rejected: graph is frozen", operation);
        throw GraphFrozen(std::string(operation) + " after freeze()");
    }
}

bool ConversionGraph::find_node(const Unit& unit, NodeId& id) const {
    auto it = index_.find(key_of(unit));
    if (it == index_.end()) {
        return false;
    }
    id = it->second;
    return true;
}

bool ConversionGraph::find_registered(const Unit& unit, NodeId& id) const {
    return find_node(unit, id) && units_[id] == unit;
}

ConversionGraph::NodeId ConversionGraph::intern(const Unit& unit) {
    NodeId id = 0;
    if (find_node(unit, id)) {
        return id;
    }
    id = units_.size();
    units_.push_back(unit);
    adjacency_.emplace_back();
    index_[key_of(unit)] = id;
    return id;
}

const ConversionGraph::Edge* ConversionGraph::find_edge(NodeId from, NodeId to) const {
    for (const auto& edge : adjacency_[from]) {
        if (edge.to == to) {
            return &edge;
        }
    }
    return nullptr;
}

void ConversionGraph::check_conflict(const Unit& src, const Unit& dst, const Map& map) const {
    NodeId s = 0;
    NodeId d = 0;
    const bool has_src = find_node(src, s);
    const bool has_dst = find_node(dst, d);

    if (has_src && units_[s] != src) {
        throw NameCollision(src.qualified_name() + " is already registered with a different definition");
    }
    if (has_dst && units_[d] != dst) {
        throw NameCollision(dst.qualified_name() + " is already registered with a different definition");
    }
    if (!has_src || !has_dst) {
        return;
    }

    const Edge* forward = find_edge(s, d);
    if (forward != nullptr && forward->map != map) {
        throw DuplicateEdge(
            src.qualified_name() + " -> " + dst.qualified_name() + " is already " +
            forward->map.to_string() + ", not " + map.to_string());
    }
    const Edge* reverse = find_edge(d, s);
    if (reverse != nullptr && !(reverse->map * map).is_identity()) {
        throw DuplicateEdge(
            "round trip " + src.qualified_name() + " -> " + dst.qualified_name() + " -> " +
            src.qualified_name() + " is not the identity");
    }
}

bool ConversionGraph::insert_edge(const Unit& src, const Unit& dst, const Map& map) {
    const NodeId s = intern(src);
    const NodeId d = intern(dst);
    if (find_edge(s, d) != nullptr) {
        logger()->debug("edge {} -> {} already registered", src.qualified_name(), dst.qualified_name());
        return false;
    }
    adjacency_[s].push_back(Edge{d, map});
    adjacency_[d].push_back(Edge{s, map.invert()});
    logger()->debug("edge {} -> {}: {}", src.qualified_name(), dst.qualified_name(), map.to_string());
    return true;
}

std::size_t ConversionGraph::record_transform(const BasisTransform& transform) {
    for (std::size_t i = 0; i < transforms_.size(); ++i) {
        if (transforms_[i] == transform) {
            return i;
        }
    }
    transforms_.push_back(transform);
    transform_edges_.emplace_back();
    if (transform.is_invertible()) {
        inverses_.push_back(transform.invert());
    }
    return transforms_.size() - 1;
}

void ConversionGraph::check_system(const UnitSystem& system) const {
    auto known = system_bases_.find(system.name());
    for (const auto& component : system.dimensions()) {
        const Unit& base = system.base_for(component);
        NodeId id = 0;
        if (find_node(base, id) && units_[id] != base) {
            throw NameCollision(base.qualified_name() + " is already registered with a different definition");
        }
        if (known == system_bases_.end()) continue;
        auto it = known->second.find(component);
        if (it == known->second.end() || it->second != base) {
            throw NameCollision("system '" + system.name() + "' is already registered with other base units");
        }
    }
    if (known != system_bases_.end() && known->second.size() != system.dimensions().size()) {
        throw NameCollision("system '" + system.name() + "' is already registered with other base units");
    }
}

void ConversionGraph::store_system(const UnitSystem& system) {
    if (system_bases_.count(system.name())) {
        return;
    }
    std::map<std::string, Unit> bases;
    for (const auto& component : system.dimensions()) {
        bases.emplace(component, system.base_for(component));
    }
    system_bases_.emplace(system.name(), bases);
    logger()->debug("system '{}' registered with {} base units", system.name(), bases.size());
}

void ConversionGraph::register_system(const UnitSystem& system) {
    require_mutable("register_system");
    check_system(system);
    store_system(system);
}

void ConversionGraph::add_edge(const Unit& src, const Unit& dst, const Map& map) {
    require_mutable("add_edge");
    if (src.dimension() != dst.dimension()) {
        logger()->warn("add_edge {} -> {} rejected: {} vs {}", src.qualified_name(), dst.qualified_name(),
                       src.dimension().to_string(), dst.dimension().to_string());
        throw IncompatibleDimensions(
            src.qualified_name() + " is " + src.dimension().to_string() + " but " +
            dst.qualified_name() + " is " + dst.dimension().to_string());
    }
    if (src.same_identity(dst)) {
        if (src != dst) {
            throw NameCollision(src.qualified_name() + " is given with two different definitions");
        }
        if (!map.is_identity()) {
            throw DuplicateEdge("self-conversion of " + src.qualified_name() + " must be the identity");
        }
        check_conflict(src, src, map);
        intern(src);
        return;
    }
    map.invert();
    check_conflict(src, dst, map);
    insert_edge(src, dst, map);
}

void ConversionGraph::add_edge(const Unit& src, const Unit& dst, const Map& map,
                               const BasisTransform& transform) {
    require_mutable("add_edge");
    if (!transform.validate_edge(src, dst)) {
        logger()->warn("add_edge {} -> {} rejected by {}", src.qualified_name(), dst.qualified_name(),
                       transform.to_string());
        throw IncompatibleDimensions(
            transform.to_string() + " does not map " + src.dimension().to_string() + " onto " +
            dst.dimension().to_string());
    }
    map.invert();
    check_conflict(src, dst, map);
    insert_edge(src, dst, map);

    const std::size_t slot = record_transform(transform);
    const auto pair = std::make_pair(index_.at(key_of(src)), index_.at(key_of(dst)));
    for (const auto& existing : transform_edges_[slot]) {
        if (existing == pair) return;
    }
    transform_edges_[slot].push_back(pair);
}

void ConversionGraph::connect_systems(const BasisTransform& transform,
                                      const UnitSystem& src_system,
                                      const UnitSystem& dst_system,
                                      const std::vector<Calibration>& calibrations) {
    require_mutable("connect_systems");
    if (!same_basis(src_system.basis(), transform.src())) {
        throw ShapeMismatch("system '" + src_system.name() + "' is not on basis '" + transform.src()->name() + "'");
    }
    if (!same_basis(dst_system.basis(), transform.dst())) {
        throw ShapeMismatch("system '" + dst_system.name() + "' is not on basis '" + transform.dst()->name() + "'");
    }
    if (!transform.is_invertible()) {
        logger()->warn("connect_systems {} -> {} rejected: {} is not invertible", src_system.name(),
                       dst_system.name(), transform.to_string());
        throw NonInvertibleTransform(
            "connecting '" + src_system.name() + "' and '" + dst_system.name() + "' requires an invertible " +
            transform.to_string());
    }

    const std::vector<std::size_t> axes = axes_of(transform);
    std::vector<Staged> pending;

    // Coherent calibration per source dimension: coherent source unit -> coherent destination unit.
    std::vector<Map> coherent(axes.size(), Map::identity());
    std::vector<bool> calibrated(axes.size(), false);

    for (const auto& calibration : calibrations) {
        const Unit* a = &calibration.src;
        const Unit* b = &calibration.dst;
        Map m = calibration.map;
        std::size_t slot = axes.size();

        // Owning systems decide the direction; on a shared basis with no
        // system hint, the forward reading wins.
        bool reversed = false;
        if (src_system.name() != dst_system.name() &&
            a->system() == dst_system.name() && b->system() == src_system.name()) {
            reversed = true;
        } else if (!calibrates(transform, axes, *a, *b, slot)) {
            reversed = calibrates(transform, axes, *b, *a, slot);
        }
        if (reversed) {
            std::swap(a, b);
            m = m.invert();
        }

        if (!calibrates(transform, axes, *a, *b, slot)) {
            throw IncompatibleDimensions(
                "calibration " + a->qualified_name() + " -> " + b->qualified_name() +
                " does not pair a source base dimension with its image under " + transform.to_string());
        }

        const Map c = Map::linear(b->scale()) * m * Map::linear(div(rational(1), a->scale()));
        if (calibrated[slot] && coherent[slot] != c) {
            throw DuplicateEdge("conflicting calibrations for '" + transform.src_dimensions()[slot] + "'");
        }
        coherent[slot] = c;
        calibrated[slot] = true;
        stage(pending, *a, *b, m);
    }

    for (const auto& u : src_system.units()) {
        Dimension image(transform.dst());
        try {
            image = transform.apply_to_dimension(u.dimension());
        } catch (const DimensionMismatch&) {
            continue;
        }

        for (const auto& w : dst_system.units()) {
            if (w.dimension() != image) continue;

            Map bridge = Map::identity();
            std::size_t axis = 0;
            std::size_t slot = axes.size();
            if (u.dimension().pure_axis(axis)) {
                for (std::size_t i = 0; i < axes.size(); ++i) {
                    if (axes[i] == axis) slot = i;
                }
            }
            if (slot < axes.size()) {
                if (!calibrated[slot]) {
                    throw MissingCalibration(
                        "no calibration for '" + transform.src_dimensions()[slot] + "' needed by " +
                        u.qualified_name() + " -> " + w.qualified_name());
                }
                bridge = coherent[slot];
            } else {
                for (std::size_t i = 0; i < axes.size(); ++i) {
                    const Rational& e = u.dimension()[axes[i]];
                    if (is_zero(e)) continue;
                    if (!calibrated[i]) {
                        throw MissingCalibration(
                            "no calibration for '" + transform.src_dimensions()[i] + "' needed by " +
                            u.qualified_name() + " -> " + w.qualified_name());
                    }
                    if (!coherent[i].is_linear()) {
                        throw InvalidExponent(
                            "affine calibration for '" + transform.src_dimensions()[i] +
                            "' cannot be combined into " + u.dimension().to_string());
                    }
                    bridge = bridge * coherent[i].power(e);
                }
            }

            const Map derived = Map::linear(div(rational(1), w.scale())) * bridge * Map::linear(u.scale());
            stage(pending, u, w, derived);
        }
    }

    for (const auto& p : pending) {
        check_conflict(p.src, p.dst, p.map);
    }
    check_system(src_system);
    if (dst_system.name() != src_system.name()) {
        check_system(dst_system);
    }

    std::size_t added = 0;
    std::vector<std::pair<NodeId, NodeId>> pairs;
    for (const auto& p : pending) {
        if (insert_edge(p.src, p.dst, p.map)) {
            ++added;
        }
        pairs.emplace_back(index_.at(key_of(p.src)), index_.at(key_of(p.dst)));
    }

    store_system(src_system);
    store_system(dst_system);

    const std::size_t slot = record_transform(transform);
    for (const auto& pair : pairs) {
        bool known = false;
        for (const auto& existing : transform_edges_[slot]) {
            if (existing == pair) known = true;
        }
        if (!known) transform_edges_[slot].push_back(pair);
    }

    logger()->info("connected '{}' -> '{}': {} edges derived, {} new", src_system.name(), dst_system.name(),
                   pending.size(), added);
}

bool ConversionGraph::dimensions_related(const Dimension& src, const Dimension& dst) const {
    if (src == dst) {
        return true;
    }
    for (const auto& transform : transforms_) {
        if (transform.maps(src, dst)) {
            return true;
        }
    }
    for (const auto& inverse : inverses_) {
        if (inverse.maps(src, dst)) {
            return true;
        }
    }
    return false;
}

void ConversionGraph::require_related(const Unit& src, const Unit& dst) const {
    if (!dimensions_related(src.dimension(), dst.dimension())) {
        throw DimensionMismatch(
            src.qualified_name() + " is " + src.dimension().to_string() + " but " +
            dst.qualified_name() + " is " + dst.dimension().to_string());
    }
}

std::vector<ConversionGraph::NodeId> ConversionGraph::search(NodeId src, NodeId dst) const {
    std::vector<NodeId> parent(units_.size(), no_node);
    std::deque<NodeId> queue;
    parent[src] = src;
    queue.push_back(src);

    while (!queue.empty()) {
        const NodeId current = queue.front();
        queue.pop_front();
        if (current == dst) break;

        for (const auto& edge : adjacency_[current]) {
            if (parent[edge.to] != no_node) continue;
            parent[edge.to] = current;
            queue.push_back(edge.to);
        }
    }

    std::vector<NodeId> path;
    if (parent[dst] == no_node) {
        return path;
    }
    for (NodeId at = dst; at != src; at = parent[at]) {
        path.push_back(at);
    }
    path.push_back(src);
    return std::vector<NodeId>(path.rbegin(), path.rend());
}

std::vector<ConversionGraph::NodeId> ConversionGraph::path_between(const Unit& src, const Unit& dst) const {
    NodeId s = 0;
    NodeId d = 0;
    if (!find_registered(src, s) || !find_registered(dst, d)) {
        return std::vector<NodeId>();
    }
    return search(s, d);
}

Map ConversionGraph::compose_path(const std::vector<NodeId>& path) const {
    Map result = Map::identity();
    for (std::size_t i = 1; i < path.size(); ++i) {
        result = find_edge(path[i - 1], path[i])->map * result;
    }
    return result;
}

// x in src -> x * src.scale coherent src units -> per base component through
// the graph -> divided by dst.scale. Both units must share one dimension and
// belong to registered systems that cover all of its components.
bool ConversionGraph::factorwise(const Unit& src, const Unit& dst, Map& result) const {
    if (src.dimension() != dst.dimension()) {
        return false;
    }
    auto from = system_bases_.find(src.system());
    auto to = system_bases_.find(dst.system());
    if (from == system_bases_.end() || to == system_bases_.end()) {
        return false;
    }

    const Dimension& dimension = src.dimension();
    const auto& components = dimension.basis()->components();
    Map bridge = Map::identity();
    for (std::size_t k = 0; k < components.size(); ++k) {
        const Rational& e = dimension[k];
        if (is_zero(e)) continue;

        auto a = from->second.find(components[k]);
        auto b = to->second.find(components[k]);
        if (a == from->second.end() || b == to->second.end()) {
            return false;
        }
        if (a->second == b->second) continue;

        const std::vector<NodeId> path = path_between(a->second, b->second);
        if (path.empty()) {
            return false;
        }
        bridge = bridge * compose_path(path).power(e);
    }

    result = Map::linear(div(rational(1), dst.scale())) * bridge * Map::linear(src.scale());
    return true;
}

std::vector<Unit> ConversionGraph::conversion_path(const Unit& src, const Unit& dst) const {
    if (src == dst) {
        return std::vector<Unit>(1, src);
    }
    require_related(src, dst);

    NodeId s = 0;
    NodeId d = 0;
    if (!find_registered(src, s)) {
        throw NoConversionPath(src.qualified_name() + " is not in the graph");
    }
    if (!find_registered(dst, d)) {
        throw NoConversionPath(dst.qualified_name() + " is not in the graph");
    }

    const std::vector<NodeId> ids = search(s, d);
    if (ids.empty()) {
        throw NoConversionPath("no path from " + src.qualified_name() + " to " + dst.qualified_name());
    }

    std::vector<Unit> path;
    path.reserve(ids.size());
    for (NodeId id : ids) {
        path.push_back(units_[id]);
    }
    return path;
}

Map ConversionGraph::convert(const Unit& src, const Unit& dst) const {
    if (src == dst) {
        return Map::identity();
    }
    require_related(src, dst);

    const std::vector<NodeId> path = path_between(src, dst);
    if (!path.empty()) {
        Map result = compose_path(path);
        logger()->trace("convert {} -> {}: {} hops, {}", src.qualified_name(), dst.qualified_name(),
                        path.size() - 1, result.to_string());
        return result;
    }

    Map result = Map::identity();
    if (factorwise(src, dst, result)) {
        logger()->trace("convert {} -> {}: factorwise, {}", src.qualified_name(), dst.qualified_name(),
                        result.to_string());
        return result;
    }
    NodeId id = 0;
    if (!find_registered(src, id)) {
        throw NoConversionPath(src.qualified_name() + " is not in the graph");
    }
    if (!find_registered(dst, id)) {
        throw NoConversionPath(dst.qualified_name() + " is not in the graph");
    }
    throw NoConversionPath("no path from " + src.qualified_name() + " to " + dst.qualified_name());
}

bool ConversionGraph::has_unit(const Unit& unit) const {
    NodeId id = 0;
    return find_registered(unit, id);
}

bool ConversionGraph::has_edge(const Unit& src, const Unit& dst) const {
    NodeId s = 0;
    NodeId d = 0;
    return find_registered(src, s) && find_registered(dst, d) && find_edge(s, d) != nullptr;
}

std::size_t ConversionGraph::edge_count() const {
    std::size_t count = 0;
    for (const auto& edges : adjacency_) {
        count += edges.size();
    }
    return count;
}

std::vector<std::pair<Unit, Unit>> ConversionGraph::edges_for_transform(const BasisTransform& transform) const {
    std::vector<std::pair<Unit, Unit>> result;
    for (std::size_t i = 0; i < transforms_.size(); ++i) {
        if (transforms_[i] != transform) continue;
        for (const auto& pair : transform_edges_[i]) {
            result.emplace_back(units_[pair.first], units_[pair.second]);
        }
    }
    return result;
}

}
