#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <symengine/integer.h>
#include <symengine/rational.h>

#include "unitgraph/basis_transform.h"
#include "unitgraph/dimension.h"
#include "unitgraph/graph.h"
#include "unitgraph/logging.h"
#include "unitgraph/map.h"
#include "unitgraph/unit.h"

namespace py = pybind11;

namespace {

using unitgraph::Rational;

// Accepts an int or a (numerator, denominator) pair.
Rational rational_arg(const py::handle& value) {
    if (py::isinstance<py::int_>(value)) {
        return unitgraph::rational(value.cast<long>());
    }
    if (py::isinstance<py::tuple>(value)) {
        auto pair = value.cast<py::tuple>();
        if (pair.size() == 2) {
            return unitgraph::rational(pair[0].cast<long>(), pair[1].cast<long>());
        }
    }
    throw unitgraph::ShapeMismatch("expected an int or a (numerator, denominator) pair");
}

std::vector<Rational> rationals_arg(const py::iterable& values) {
    std::vector<Rational> result;
    for (const auto& v : values) {
        result.push_back(rational_arg(v));
    }
    return result;
}

// Built from decimal text so values wider than a machine word survive.
py::int_ int_out(const SymEngine::Integer& value) {
    return py::int_(py::str(value.__str__()));
}

py::tuple rational_out(const Rational& value) {
    if (SymEngine::is_a<SymEngine::Integer>(*value)) {
        return py::make_tuple(int_out(SymEngine::down_cast<const SymEngine::Integer&>(*value)), py::int_(1));
    }
    SymEngine::RCP<const SymEngine::Integer> num;
    SymEngine::RCP<const SymEngine::Integer> den;
    SymEngine::get_num_den(SymEngine::down_cast<const SymEngine::Rational&>(*value), SymEngine::outArg(num),
                           SymEngine::outArg(den));
    return py::make_tuple(int_out(*num), int_out(*den));
}

std::shared_ptr<unitgraph::Basis> mutable_basis(const unitgraph::BasisPtr& basis) {
    return std::const_pointer_cast<unitgraph::Basis>(basis);
}

}

PYBIND11_MODULE(unitgraph, m) {
    m.doc() = "Exact unit conversion graph with basis transforms";

    auto base = py::register_exception<unitgraph::UnitGraphError>(m, "UnitGraphError");
    py::register_exception<unitgraph::ShapeMismatch>(m, "ShapeMismatch", base.ptr());
    py::register_exception<unitgraph::InvalidBaseUnit>(m, "InvalidBaseUnit", base.ptr());
    py::register_exception<unitgraph::NameCollision>(m, "NameCollision", base.ptr());
    py::register_exception<unitgraph::UnknownUnit>(m, "UnknownUnit", base.ptr());
    py::register_exception<unitgraph::DimensionNotCovered>(m, "DimensionNotCovered", base.ptr());
    py::register_exception<unitgraph::IncompatibleDimensions>(m, "IncompatibleDimensions", base.ptr());
    py::register_exception<unitgraph::DimensionMismatch>(m, "DimensionMismatch", base.ptr());
    py::register_exception<unitgraph::NonInvertibleMap>(m, "NonInvertibleMap", base.ptr());
    py::register_exception<unitgraph::InvalidExponent>(m, "InvalidExponent", base.ptr());
    py::register_exception<unitgraph::NonInvertibleTransform>(m, "NonInvertibleTransform", base.ptr());
    py::register_exception<unitgraph::MissingCalibration>(m, "MissingCalibration", base.ptr());
    py::register_exception<unitgraph::DuplicateEdge>(m, "DuplicateEdge", base.ptr());
    py::register_exception<unitgraph::NoConversionPath>(m, "NoConversionPath", base.ptr());
    py::register_exception<unitgraph::GraphFrozen>(m, "GraphFrozen", base.ptr());

    m.def("configure_logging", &unitgraph::configure_logging);

    py::class_<unitgraph::Basis, std::shared_ptr<unitgraph::Basis>>(m, "Basis")
        .def(py::init([](std::string name, std::vector<std::string> components) {
                 return std::make_shared<unitgraph::Basis>(std::move(name), std::move(components));
             }),
             py::arg("name"), py::arg("components"))
        .def_static("standard", [] { return mutable_basis(unitgraph::Basis::standard()); })
        .def_property_readonly("name", &unitgraph::Basis::name)
        .def_property_readonly("components", &unitgraph::Basis::components)
        .def("index", &unitgraph::Basis::index)
        .def("__eq__", &unitgraph::Basis::operator==)
        .def("__len__", &unitgraph::Basis::size);

    py::class_<unitgraph::Dimension>(m, "Dimension")
        .def(py::init([](std::shared_ptr<unitgraph::Basis> basis) { return unitgraph::Dimension(basis); }),
             py::arg("basis"))
        .def(py::init([](std::shared_ptr<unitgraph::Basis> basis, const py::iterable& exponents) {
                 return unitgraph::Dimension(basis, rationals_arg(exponents));
             }),
             py::arg("basis"), py::arg("exponents"))
        .def_static("base", [](std::shared_ptr<unitgraph::Basis> basis, const std::string& component) {
            return unitgraph::Dimension::base(basis, component);
        })
        .def_property_readonly("basis", [](const unitgraph::Dimension& d) { return mutable_basis(d.basis()); })
        .def_property_readonly("exponents", [](const unitgraph::Dimension& d) {
            py::list out;
            for (const auto& e : d.exponents()) {
                out.append(rational_out(e));
            }
            return out;
        })
        .def("is_dimensionless", &unitgraph::Dimension::is_dimensionless)
        .def("__add__", &unitgraph::Dimension::operator+)
        .def("__sub__", &unitgraph::Dimension::operator-)
        .def("__pow__", [](const unitgraph::Dimension& d, const py::object& n) { return unitgraph::power(d, rational_arg(n)); })
        .def("__eq__", &unitgraph::Dimension::operator==)
        .def("__str__", &unitgraph::Dimension::to_string);

    py::class_<unitgraph::Unit>(m, "Unit")
        .def(py::init([](std::string name, const unitgraph::Dimension& dimension, std::vector<std::string> aliases,
                         const py::object& scale) {
                 return unitgraph::Unit(std::move(name), dimension, std::move(aliases), rational_arg(scale));
             }),
             py::arg("name"), py::arg("dimension"), py::arg("aliases") = std::vector<std::string>{},
             py::arg("scale") = 1)
        .def_property_readonly("name", &unitgraph::Unit::name)
        .def_property_readonly("aliases", &unitgraph::Unit::aliases)
        .def_property_readonly("dimension", &unitgraph::Unit::dimension)
        .def_property_readonly("scale", [](const unitgraph::Unit& u) { return rational_out(u.scale()); })
        .def_property_readonly("system", &unitgraph::Unit::system)
        .def_property_readonly("is_base", &unitgraph::Unit::is_base)
        .def("__eq__", &unitgraph::Unit::operator==)
        .def("__str__", &unitgraph::Unit::qualified_name);

    py::class_<unitgraph::UnitSystem>(m, "UnitSystem")
        .def(py::init([](std::string name, std::shared_ptr<unitgraph::Basis> basis,
                         const std::map<std::string, unitgraph::Unit>& bases) {
                 return unitgraph::UnitSystem(std::move(name), basis, bases);
             }),
             py::arg("name"), py::arg("basis"), py::arg("bases"))
        .def_property_readonly("name", &unitgraph::UnitSystem::name)
        .def("add_unit", &unitgraph::UnitSystem::add_unit, py::return_value_policy::copy)
        .def("lookup", &unitgraph::UnitSystem::lookup, py::return_value_policy::copy)
        .def("covers", &unitgraph::UnitSystem::covers)
        .def("base_for", &unitgraph::UnitSystem::base_for, py::return_value_policy::copy)
        .def("dimensions", &unitgraph::UnitSystem::dimensions)
        .def("units", &unitgraph::UnitSystem::units, py::return_value_policy::copy);

    py::class_<unitgraph::Map>(m, "Map")
        .def_static("identity", &unitgraph::Map::identity)
        .def_static("linear", [](const py::object& scale) { return unitgraph::Map::linear(rational_arg(scale)); })
        .def_static("affine", [](const py::object& scale, const py::object& offset) {
            return unitgraph::Map::affine(rational_arg(scale), rational_arg(offset));
        })
        .def("apply", py::overload_cast<double>(&unitgraph::Map::apply, py::const_))
        .def("compose", &unitgraph::Map::compose)
        .def("invert", &unitgraph::Map::invert)
        .def("power", [](const unitgraph::Map& map, const py::object& n) { return map.power(rational_arg(n)); })
        .def("is_linear", &unitgraph::Map::is_linear)
        .def("is_identity", &unitgraph::Map::is_identity)
        .def("__mul__", &unitgraph::Map::compose)
        .def("__eq__", &unitgraph::Map::operator==)
        .def("__str__", &unitgraph::Map::to_string);

    py::class_<unitgraph::BasisTransform>(m, "BasisTransform")
        .def(py::init([](std::shared_ptr<unitgraph::Basis> src, std::shared_ptr<unitgraph::Basis> dst,
                         std::vector<std::string> src_dimensions, std::vector<std::string> dst_dimensions,
                         const py::iterable& rows) {
                 unitgraph::RationalMatrix matrix;
                 for (const auto& row : rows) {
                     matrix.push_back(rationals_arg(row.cast<py::iterable>()));
                 }
                 return unitgraph::BasisTransform(src, dst, std::move(src_dimensions), std::move(dst_dimensions),
                                                  std::move(matrix));
             }),
             py::arg("src"), py::arg("dst"), py::arg("src_dimensions"), py::arg("dst_dimensions"), py::arg("matrix"))
        .def("is_invertible", &unitgraph::BasisTransform::is_invertible)
        .def("determinant", [](const unitgraph::BasisTransform& t) { return rational_out(t.determinant()); })
        .def("invert", &unitgraph::BasisTransform::invert)
        .def("apply_to_dimension", &unitgraph::BasisTransform::apply_to_dimension)
        .def("validate_edge", &unitgraph::BasisTransform::validate_edge)
        .def("__eq__", &unitgraph::BasisTransform::operator==)
        .def("__str__", &unitgraph::BasisTransform::to_string);

    py::class_<unitgraph::Calibration>(m, "Calibration")
        .def(py::init([](const unitgraph::Unit& src, const unitgraph::Unit& dst, const unitgraph::Map& map) {
                 return unitgraph::Calibration{src, dst, map};
             }),
             py::arg("src"), py::arg("dst"), py::arg("map"))
        .def_readonly("src", &unitgraph::Calibration::src)
        .def_readonly("dst", &unitgraph::Calibration::dst)
        .def_readonly("map", &unitgraph::Calibration::map);

    py::class_<unitgraph::ConversionGraph>(m, "ConversionGraph")
        .def(py::init<>())
        .def("add_edge",
             py::overload_cast<const unitgraph::Unit&, const unitgraph::Unit&, const unitgraph::Map&>(
                 &unitgraph::ConversionGraph::add_edge),
             py::arg("src"), py::arg("dst"), py::arg("map"))
        .def("add_edge",
             py::overload_cast<const unitgraph::Unit&, const unitgraph::Unit&, const unitgraph::Map&,
                               const unitgraph::BasisTransform&>(&unitgraph::ConversionGraph::add_edge),
             py::arg("src"), py::arg("dst"), py::arg("map"), py::arg("transform"))
        .def("connect_systems", &unitgraph::ConversionGraph::connect_systems,
             py::arg("transform"), py::arg("src_system"), py::arg("dst_system"), py::arg("calibrations"))
        .def("convert", &unitgraph::ConversionGraph::convert, py::arg("src"), py::arg("dst"))
        .def("register_system", &unitgraph::ConversionGraph::register_system, py::arg("system"))
        .def("has_system", &unitgraph::ConversionGraph::has_system)
        .def("conversion_path", &unitgraph::ConversionGraph::conversion_path, py::arg("src"), py::arg("dst"))
        .def("has_unit", &unitgraph::ConversionGraph::has_unit)
        .def("has_edge", &unitgraph::ConversionGraph::has_edge)
        .def("unit_count", &unitgraph::ConversionGraph::unit_count)
        .def("edge_count", &unitgraph::ConversionGraph::edge_count)
        .def("transforms", &unitgraph::ConversionGraph::transforms, py::return_value_policy::copy)
        .def("edges_for_transform", &unitgraph::ConversionGraph::edges_for_transform)
        .def("freeze", &unitgraph::ConversionGraph::freeze)
        .def("frozen", &unitgraph::ConversionGraph::frozen);
}
