#include "derivative_map.hpp"
#include <common/errors.hpp>
#include <string>

namespace ostiamesh {

DerivativeCombination::DerivativeCombination(int c1, int c2, int c3)
    : coefficients_{c1, c2, c3} {
    for (int c : coefficients_) {
        if (c < -1 || c > 1) {
            throw PreconditionViolation("DerivativeCombination: coefficient " +
                                        std::to_string(c) + " not in {-1, 0, 1}");
        }
    }
}

Vec3 DerivativeCombination::apply(const Vec3& d1, const Vec3& d2, const Vec3& d3) const {
    return d1 * coefficients_[0] + d2 * coefficients_[1] + d3 * coefficients_[2];
}

MappedDerivatives mapped_derivatives(const Vec3& d1, const Vec3& d2, const Vec3& d3,
                                     const DerivativeMap& map) {
    MappedDerivatives result{d1, d2};
    if (map.d1) {
        result.d1 = map.d1->apply(d1, d2, d3);
        if (map.has_other_side_d1) {
            Vec3 other = map.other_side_d1 ? map.other_side_d1->apply(d1, d2, d3) : d1;
            result.d1 = (result.d1 + other) * 0.5;
        }
    }
    if (map.d2) {
        result.d2 = map.d2->apply(d1, d2, d3);
    }
    return result;
}

CornerMapping corner_mapping(const DerivativeMap& map, bool lower_xi1_corner) {
    CornerMapping corner;
    corner.d1 = (lower_xi1_corner && map.has_other_side_d1) ? map.other_side_d1 : map.d1;
    corner.d2 = map.d2;
    corner.d3 = map.d3;
    return corner;
}

}  // namespace ostiamesh
