#pragma once

#include <stdexcept>
#include <string>

namespace ss {

// Bad caller input: unknown axis name, non-positive downsample factor, ...
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

// Matrix or grid dimensions that do not match the documented contract.
class ShapeMismatch : public std::invalid_argument {
public:
    explicit ShapeMismatch(const std::string& what) : std::invalid_argument(what) {}
};

// An atlas collaborator failed: transport error, HTTP error status,
// malformed reply, undecodable image.
class CollaboratorError : public std::runtime_error {
public:
    explicit CollaboratorError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ss
