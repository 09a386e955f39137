#ifndef OSTIAMESH_COMMON_ERRORS_HPP
#define OSTIAMESH_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ostiamesh {

// Caller supplied inputs that break a documented precondition
// (array sizes, counts, indices, coefficient ranges).
class PreconditionViolation : public std::invalid_argument {
public:
    explicit PreconditionViolation(const std::string& what)
        : std::invalid_argument(what) {}
};

// Start and end rings of a bridge do not have the same shape.
class ShapeMismatch : public PreconditionViolation {
public:
    explicit ShapeMismatch(const std::string& what)
        : PreconditionViolation(what) {}
};

// Tangent pair with zero area, or a normal that cannot be formed.
class DegenerateSurface : public std::runtime_error {
public:
    explicit DegenerateSurface(const std::string& what)
        : std::runtime_error(what) {}
};

}  // namespace ostiamesh

#endif // OSTIAMESH_COMMON_ERRORS_HPP
