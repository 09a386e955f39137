#ifndef OSTIAMESH_ANNULUS_DERIVATIVE_MAP_HPP
#define OSTIAMESH_ANNULUS_DERIVATIVE_MAP_HPP

#include <math/vec3.hpp>
#include <array>
#include <cstddef>
#include <optional>

namespace ostiamesh {

// Signed sum of a node's source derivatives (d1, d2, d3), each coefficient
// one of -1, 0, 1
class DerivativeCombination {
public:
    DerivativeCombination() = default;

    // Throws PreconditionViolation for coefficients outside {-1, 0, 1}
    DerivativeCombination(int c1, int c2, int c3);

    const std::array<int, 3>& coefficients() const { return coefficients_; }
    int operator[](std::size_t i) const { return coefficients_[i]; }

    Vec3 apply(const Vec3& d1, const Vec3& d2, const Vec3& d3) const;

    bool is_zero() const {
        return coefficients_[0] == 0 && coefficients_[1] == 0 && coefficients_[2] == 0;
    }
    bool has_negative() const {
        return coefficients_[0] < 0 || coefficients_[1] < 0 || coefficients_[2] < 0;
    }

    bool operator==(const DerivativeCombination& other) const {
        return coefficients_ == other.coefficients_;
    }

private:
    std::array<int, 3> coefficients_{0, 0, 0};
};

// How the element derivatives d/dxi1, d/dxi2, d/dxi3 at a boundary node are
// formed from the node's stored d1, d2, d3. An empty slot uses the stored
// derivative unchanged. A node may carry a different d/dxi1 for the element
// on its lower xi1 side (the "other side"), used where the ring turns a
// corner or pinches.
struct DerivativeMap {
    std::optional<DerivativeCombination> d1;
    std::optional<DerivativeCombination> d2;
    std::optional<DerivativeCombination> d3;

    // Set when the fourth slot exists, even if its combination is empty
    bool has_other_side_d1 = false;
    std::optional<DerivativeCombination> other_side_d1;

    // Both d/dxi1 slots present and zero: the node is a pinch where
    // neighbouring corners around the ring collapse together
    bool collapsed() const {
        return has_other_side_d1 && d1 && d1->is_zero() &&
               other_side_d1 && other_side_d1->is_zero();
    }

    bool is_identity() const {
        return !d1 && !d2 && !d3 && !has_other_side_d1;
    }
};

// Effective around (d1) and radial (d2) derivatives at a node. With an
// other-side slot the two d/dxi1 values are averaged.
struct MappedDerivatives {
    Vec3 d1;
    Vec3 d2;
};

MappedDerivatives mapped_derivatives(const Vec3& d1, const Vec3& d2, const Vec3& d3,
                                     const DerivativeMap& map);

// Mapping handed to a mesh sink for one cell corner, with the side-specific
// d/dxi1 already chosen
struct CornerMapping {
    std::optional<DerivativeCombination> d1;
    std::optional<DerivativeCombination> d2;
    std::optional<DerivativeCombination> d3;

    bool is_identity() const { return !d1 && !d2 && !d3; }
};

// lower_xi1_corner: the node is the first corner around of the cell
CornerMapping corner_mapping(const DerivativeMap& map, bool lower_xi1_corner);

}  // namespace ostiamesh

#endif // OSTIAMESH_ANNULUS_DERIVATIVE_MAP_HPP
