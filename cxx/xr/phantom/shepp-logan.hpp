#pragma once

#include "map.hpp"

namespace xr {

/*
 * The modified 2D Shepp-Logan head phantom, boosted to 0.1 + 1.5 p (1/cm) over a uniform slab of the given thickness.
 */
auto SheppLogan2D(Sz2 const &matrix, float const spacing, float const thickness) -> AttenuationMap;

} // namespace xr
