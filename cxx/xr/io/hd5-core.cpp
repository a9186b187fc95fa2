#include "hd5-core.hpp"

#include "../info.hpp"
#include "../log/log.hpp"
#include "../xray/params.hpp"

#include <hdf5.h>

namespace xr {
namespace HD5 {

static_assert(sizeof(bool) == 1, "Acquisition parameters store the grid flag as a single byte");

template <> hid_t type_impl(type_tag<Index>) { return H5T_NATIVE_LONG; }

template <> hid_t type_impl(type_tag<float>) { return H5T_NATIVE_FLOAT; }

template <> hid_t type_impl(type_tag<double>) { return H5T_NATIVE_DOUBLE; }

void Init()
{
  static bool NeedsInit = true;

  if (NeedsInit) {
    auto err = H5open();
    err = H5Eset_auto(H5E_DEFAULT, nullptr, nullptr);
    if (err < 0) { throw Log::Failure("HD5", "Could not initialise HDF5, code: {}", err); }
    NeedsInit = false;
    Log::Debug("HD5", "Initialised HDF5");
  } else {
    Log::Debug("HD5", "Already initialised");
  }
}

// Saves the error at the top (bottom) of the stack in the supplied string
herr_t ErrorWalker(unsigned n, const H5E_error2_t *err_desc, void *data)
{
  std::string *str = (std::string *)data;
  if (n == 0) { *str = fmt::format("{}\n", err_desc->desc); }
  return 0;
}

std::string GetError()
{
  std::string error_string;
  H5Ewalk(H5Eget_current_stack(), H5E_WALK_UPWARD, &ErrorWalker, (void *)&error_string);
  return error_string;
}

void CheckedCall(herr_t status, std::string const &msg)
{
  if (status) { throw Log::Failure("HD5", "Error {}. Status {}. Error: {}\n", msg, status, GetError()); }
}

hid_t InfoType()
{
  hid_t   info_id = H5Tcreate(H5T_COMPOUND, sizeof(Info));
  hsize_t sz2[1] = {2};
  hid_t   float2_id = H5Tarray_create(H5T_NATIVE_FLOAT, 1, sz2);
  CheckedCall(H5Tinsert(info_id, "spacing", HOFFSET(Info, spacing), float2_id), "inserting spacing field");
  CheckedCall(H5Tinsert(info_id, "origin", HOFFSET(Info, origin), float2_id), "inserting origin field");
  return info_id;
}

hid_t DetectorType()
{
  hid_t   det_id = H5Tcreate(H5T_COMPOUND, sizeof(Detector));
  hsize_t sz2[1] = {2};
  hid_t   long2_id = H5Tarray_create(H5T_NATIVE_LONG, 1, sz2);
  hid_t   float2_id = H5Tarray_create(H5T_NATIVE_FLOAT, 1, sz2);
  CheckedCall(H5Tinsert(det_id, "shape", HOFFSET(Detector, shape), long2_id), "inserting shape field");
  CheckedCall(H5Tinsert(det_id, "pitch", HOFFSET(Detector, pitch), H5T_NATIVE_FLOAT), "inserting pitch field");
  CheckedCall(H5Tinsert(det_id, "offset", HOFFSET(Detector, offset), float2_id), "inserting offset field");
  return det_id;
}

hid_t ParamsType()
{
  hid_t pars_id = H5Tcreate(H5T_COMPOUND, sizeof(AcquisitionParams));
  CheckedCall(H5Tinsert(pars_id, "sid", HOFFSET(AcquisitionParams, sid), H5T_NATIVE_FLOAT), "inserting sid field");
  CheckedCall(H5Tinsert(pars_id, "sdd", HOFFSET(AcquisitionParams, sdd), H5T_NATIVE_FLOAT), "inserting sdd field");
  CheckedCall(H5Tinsert(pars_id, "angle", HOFFSET(AcquisitionParams, angle), H5T_NATIVE_FLOAT), "inserting angle field");
  CheckedCall(H5Tinsert(pars_id, "kVp", HOFFSET(AcquisitionParams, kVp), H5T_NATIVE_FLOAT), "inserting kVp field");
  CheckedCall(H5Tinsert(pars_id, "exposure", HOFFSET(AcquisitionParams, exposure), H5T_NATIVE_FLOAT),
              "inserting exposure field");
  CheckedCall(H5Tinsert(pars_id, "filtration", HOFFSET(AcquisitionParams, filtration), H5T_NATIVE_FLOAT),
              "inserting filtration field");
  CheckedCall(H5Tinsert(pars_id, "grid", HOFFSET(AcquisitionParams, grid), H5T_NATIVE_UCHAR), "inserting grid field");
  CheckedCall(H5Tinsert(pars_id, "detector", HOFFSET(AcquisitionParams, detector), DetectorType()),
              "inserting detector field");
  return pars_id;
}

void CheckInfoType(hid_t handle)
{
  // Use vector instead of array so I don't forget to change the size if the members change
  std::vector<std::string> const names{"spacing", "origin"};

  if (handle < 0) { throw Log::Failure("HD5", "Info struct does not exist"); }
  auto const dtype = H5Dget_type(handle);
  size_t     n_members = H5Tget_nmembers(dtype);
  // Re-ordered and extra fields are okay. Missing is not
  for (auto const &check_name : names) {
    bool found = false;
    for (size_t ii = 0; ii < n_members; ii++) {
      char             *member = H5Tget_member_name(dtype, ii);
      std::string const member_name(member);
      H5free_memory(member);
      if (member_name == check_name) {
        found = true;
        break;
      }
    }
    if (!found) { throw Log::Failure("HD5", "Field {} not found in header info", check_name); }
  }
}

auto Exists(hid_t const parent, std::string const &name) -> bool { return (H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0); }

} // namespace HD5
} // namespace xr
