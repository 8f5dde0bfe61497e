#pragma once

#include <stdexcept>
#include <string>

// Exception types raised by the tag tree and the mapper.
// Everything the mapper can recover from is reported by producing no tag,
// so these only cover misuse and incompatible schemas.

namespace nbtmap {

// Misuse of the Tag API (wrong accessor, bad child, ...).
class TagError : public std::runtime_error {
public:
    TagError(const std::string& msg) : std::runtime_error(msg) { }
};

class MappingError : public std::runtime_error {
public:
    MappingError(const std::string& msg) : std::runtime_error(msg) { }
};

// The tag does not have the shape the target type expects.
class TypeMismatchError : public MappingError {
public:
    TypeMismatchError(const std::string& msg) : MappingError(msg) { }
};

class UnsupportedTypeError : public MappingError {
public:
    UnsupportedTypeError(const std::string& msg) : MappingError(msg) { }
};

class DepthLimitError : public MappingError {
public:
    DepthLimitError(const std::string& msg) : MappingError(msg) { }
};

} // namespace nbtmap
