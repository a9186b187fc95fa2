#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace xr {
namespace HD5 {

using Handle = int64_t;
using Index = long int;

template <typename T> struct type_tag
{
};

template <size_t N> using Shape = std::array<Index, N>;

template <typename T> Handle type_impl(type_tag<T>);

template <typename T> Handle type() { return type_impl(type_tag<T>{}); }

void        Init();
Handle      InfoType();
Handle      DetectorType();
Handle      ParamsType();
void        CheckInfoType(Handle h);
auto        Exists(Handle const h, std::string const &name) -> bool;
void        CheckedCall(int status, std::string const &msg);
std::string GetError();

namespace Keys {
std::string const Angles = "angles";
std::string const BackgroundMask = "background_mask";
std::string const Info = "info";
std::string const LesionMask = "lesion_mask";
std::string const Log = "log";
std::string const Meta = "meta";
std::string const Mu = "mu";
std::string const Params = "params";
std::string const Profile = "profile";
std::string const Radiograph = "radiograph";
std::string const Sinogram = "sinogram";
std::string const Thickness = "thickness";
} // namespace Keys

// Horrible hack due to DSizes shenanigans
template <size_t N> struct DNames : std::array<std::string, N>
{
};

namespace Dims {
DNames<1> const Angles = {"angle"};
DNames<2> const Map = {"x", "y"};
DNames<1> const Profile = {"u"};
DNames<2> const Radiograph = {"u", "v"};
DNames<2> const Sinogram = {"angle", "u"};
} // namespace Dims

} // namespace HD5
} // namespace xr
