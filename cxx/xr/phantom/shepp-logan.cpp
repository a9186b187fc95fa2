#include "shepp-logan.hpp"

#include "../errors.hpp"
#include "regions.hpp"

#include <cmath>

namespace xr {

/* Ellipse parameters of the modified Shepp-Logan phantom from
 * Toft, P. (1996). The Radon Transform - Theory and Implementation. PhD thesis, Technical University of Denmark.
 */
auto SheppLogan2D(Sz2 const &matrix, float const spacing, float const thickness) -> AttenuationMap
{
  if (matrix[0] < 2 || matrix[1] < 2) { throw ParameterError("Phantom matrix {} is too small", matrix); }
  if (!(spacing > 0.f) || !(thickness > 0.f)) {
    throw ParameterError("Spacing {} and thickness {} must be positive", spacing, thickness);
  }

  std::vector<Eigen::Vector2f> const centres{{0.f, 0.f},     {0.f, -0.0184f}, {0.22f, 0.f},      {-0.22f, 0.f},
                                             {0.f, 0.35f},   {0.f, 0.1f},     {0.f, -0.1f},      {-0.08f, -0.605f},
                                             {0.f, -0.606f}, {0.06f, -0.605f}};
  // Half-axes
  std::vector<Eigen::Array2f> const ha{{0.69f, 0.92f},   {0.6624f, 0.874f}, {0.11f, 0.31f},   {0.16f, 0.41f},
                                       {0.21f, 0.25f},   {0.046f, 0.046f},  {0.046f, 0.046f}, {0.046f, 0.023f},
                                       {0.023f, 0.023f}, {0.023f, 0.046f}};
  std::vector<float> const          angles{0, 0, -18 * M_PI / 180, 18 * M_PI / 180, 0, 0, 0, 0, 0, 0};
  std::vector<float> const          ints{1.f, -0.8f, -0.2f, -0.2f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f};

  Log::Print("Phan", "Drawing 2D Shepp Logan matrix {} spacing {} mm", matrix, spacing);
  auto const xs = Linspace(matrix[0]);
  auto const ys = Linspace(matrix[1]);

  AttenuationMap map;
  map.info = CentredInfo(matrix, Eigen::Array2f::Constant(spacing));
  map.mu.resize(matrix);
  map.thickness.resize(matrix);
  for (Index iy = 0; iy < matrix[1]; iy++) {
    for (Index ix = 0; ix < matrix[0]; ix++) {
      Eigen::Vector2f const r{xs[ix], ys[iy]};
      float                 p = 0.f;
      // Loop over the 10 ellipses
      for (size_t ie = 0; ie < centres.size(); ie++) {
        Eigen::Matrix2f rot;
        rot << std::cos(angles[ie]), std::sin(angles[ie]), //
          -std::sin(angles[ie]), std::cos(angles[ie]);
        Eigen::Array2f const pe = (rot * (r - centres[ie])).array() / ha[ie];
        if (pe.matrix().norm() <= 1.f) { p += ints[ie]; }
      }
      map.mu(ix, iy) = 0.1f + 1.5f * p;
      map.thickness(ix, iy) = thickness;
    }
  }
  return map;
}

} // namespace xr
