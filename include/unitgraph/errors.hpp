#pragma once

#include <stdexcept>
#include <string>

namespace unitgraph {

class UnitGraphError : public std::runtime_error {
public:
    explicit UnitGraphError(const std::string& msg) : std::runtime_error(msg) {}
};

class ShapeMismatch : public UnitGraphError {
public:
    explicit ShapeMismatch(const std::string& msg) : UnitGraphError("ShapeMismatch: " + msg) {}
};

class InvalidBaseUnit : public UnitGraphError {
public:
    explicit InvalidBaseUnit(const std::string& msg) : UnitGraphError("InvalidBaseUnit: " + msg) {}
};

class NameCollision : public UnitGraphError {
public:
    explicit NameCollision(const std::string& msg) : UnitGraphError("NameCollision: " + msg) {}
};

class UnknownUnit : public UnitGraphError {
public:
    explicit UnknownUnit(const std::string& msg) : UnitGraphError("UnknownUnit: " + msg) {}
};

class DimensionNotCovered : public UnitGraphError {
public:
    explicit DimensionNotCovered(const std::string& msg) : UnitGraphError("DimensionNotCovered: " + msg) {}
};

class IncompatibleDimensions : public UnitGraphError {
public:
    explicit IncompatibleDimensions(const std::string& msg) : UnitGraphError("IncompatibleDimensions: " + msg) {}
};

class DimensionMismatch : public UnitGraphError {
public:
    explicit DimensionMismatch(const std::string& msg) : UnitGraphError("DimensionMismatch: " + msg) {}
};

class NonInvertibleMap : public UnitGraphError {
public:
    explicit NonInvertibleMap(const std::string& msg) : UnitGraphError("NonInvertibleMap: " + msg) {}
};

class InvalidExponent : public UnitGraphError {
public:
    explicit InvalidExponent(const std::string& msg) : UnitGraphError("InvalidExponent: " + msg) {}
};

class NonInvertibleTransform : public UnitGraphError {
public:
    explicit NonInvertibleTransform(const std::string& msg) : UnitGraphError("NonInvertibleTransform: " + msg) {}
};

class MissingCalibration : public UnitGraphError {
public:
    explicit MissingCalibration(const std::string& msg) : UnitGraphError("MissingCalibration: " + msg) {}
};

class DuplicateEdge : public UnitGraphError {
public:
    explicit DuplicateEdge(const std::string& msg) : UnitGraphError("DuplicateEdge: " + msg) {}
};

class NoConversionPath : public UnitGraphError {
public:
    explicit NoConversionPath(const std::string& msg) : UnitGraphError("NoConversionPath: " + msg) {}
};

class GraphFrozen : public UnitGraphError {
public:
    explicit GraphFrozen(const std::string& msg) : UnitGraphError("GraphFrozen: " + msg) {}
};

}
