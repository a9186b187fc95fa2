#include "reader.hpp"

#include "../info.hpp"
#include "../log/log.hpp"
#include "../types.hpp"
#include "../xray/params.hpp"
#include <filesystem>
#include <hdf5.h>
#include <hdf5_hl.h>

namespace xr {
namespace HD5 {

namespace {
herr_t AddName(hid_t, char const *name, H5L_info_t const *, void *data)
{
  auto names = reinterpret_cast<std::vector<std::string> *>(data);
  names->push_back(name);
  return 0;
}

auto Names(Handle const group) -> std::vector<std::string>
{
  std::vector<std::string> names;
  CheckedCall(H5Literate(group, H5_INDEX_NAME, H5_ITER_INC, NULL, AddName, &names), "listing group");
  return names;
}
} // namespace

Reader::Reader(std::string const &fname)
{
  if (!std::filesystem::exists(fname)) { throw Log::Failure("HD5", "File does not exist: {}", fname); }
  Init();
  handle_ = H5Fopen(fname.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (handle_ < 0) { throw Log::Failure("HD5", "Failed to open {}", fname); }
  Log::Print("HD5", "Opened {} for reading id {}", fname, handle_);
}

Reader::~Reader()
{
  H5Fclose(handle_);
  Log::Debug("HD5", "Closed id {}", handle_);
}

auto Reader::list() const -> std::vector<std::string> { return Names(handle_); }

auto Reader::order(std::string const &name) const -> Index
{
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor {}", name); }
  hid_t     ds = H5Dget_space(dset);
  int const ndims = H5Sget_simple_extent_ndims(ds);
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  return ndims;
}

auto Reader::dimensions(std::string const &label) const -> std::vector<Index>
{
  hid_t dset = H5Dopen(handle_, label.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor {}", label); }

  hid_t                ds = H5Dget_space(dset);
  int const            ND = H5Sget_simple_extent_ndims(ds);
  std::vector<hsize_t> hdims(ND);
  H5Sget_simple_extent_dims(ds, hdims.data(), NULL);
  std::vector<Index> dims(ND);
  for (int ii = 0; ii < ND; ii++) {
    dims[ii] = hdims[ii];
  }
  std::reverse(dims.begin(), dims.end()); // HD5=row-major, Eigen=col-major
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  return dims;
}

auto Reader::listNames(std::string const &name) const -> std::vector<std::string>
{
  hid_t ds = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (ds < 0) { throw Log::Failure("HD5", "Could not open tensor '{}'", name); }
  hid_t                    dspace = H5Dget_space(ds);
  int const                ndims = H5Sget_simple_extent_ndims(dspace);
  std::vector<std::string> names(ndims);
  char                     buffer[64] = {0};
  for (Index ii = 0; ii < ndims; ii++) {
    H5DSget_label(ds, ii, buffer, sizeof(buffer));
    names[ii] = std::string(buffer);
  }
  std::reverse(names.begin(), names.end());
  CheckedCall(H5Sclose(dspace), "Could not close dataspace");
  CheckedCall(H5Dclose(ds), "Could not close dataset");
  return names;
}

template <typename T> auto Reader::readTensor(std::string const &name) const -> T
{
  constexpr auto ND = T::NumDimensions;
  using Scalar = typename T::Scalar;
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor '{}'", name); }
  hid_t      ds = H5Dget_space(dset);
  auto const rank = H5Sget_simple_extent_ndims(ds);
  if (rank != ND) { throw Log::Failure("HD5", "Tensor {} has rank {} expected {}", name, rank, ND); }

  std::array<hsize_t, ND> dims;
  H5Sget_simple_extent_dims(ds, dims.data(), NULL);
  typename Eigen::Tensor<Scalar, ND>::Dimensions tDims;
  std::copy_n(dims.begin(), ND, tDims.begin());
  std::reverse(tDims.begin(), tDims.end()); // HD5=row-major, Eigen=col-major
  Eigen::Tensor<Scalar, ND> tensor(tDims);
  herr_t ret_value = H5Dread(dset, type<Scalar>(), ds, H5S_ALL, H5P_DATASET_XFER_DEFAULT, tensor.data());
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  if (ret_value < 0) {
    throw Log::Failure("HD5", "Error reading tensor {} code {}", name, ret_value);
  } else {
    Log::Debug("HD5", "Read tensor {} shape {}", name, tDims);
  }
  return tensor;
}

template auto Reader::readTensor<Re1>(std::string const &) const -> Re1;
template auto Reader::readTensor<Re2>(std::string const &) const -> Re2;

auto Reader::readString(std::string const &name) const -> std::string
{
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open dataset '{}'", name); }
  hid_t      ds = H5Dget_space(dset);
  auto const rank = H5Sget_simple_extent_ndims(ds);
  if (rank != 1) { throw Log::Failure("HD5", "String {} has rank {} on disk, must be 1", name, rank); }
  hid_t const tid = H5Tcopy(H5T_C_S1);
  H5Tset_size(tid, H5T_VARIABLE);
  H5Tset_cset(tid, H5T_CSET_UTF8);
  char *rdata[1] = {nullptr};
  CheckedCall(H5Dread(dset, tid, ds, H5S_ALL, H5P_DATASET_XFER_DEFAULT, rdata), "Could not read string");
  std::string const r(rdata[0]);
  CheckedCall(H5Dvlen_reclaim(tid, ds, H5P_DEFAULT, rdata), "Could not reclaim string");
  CheckedCall(H5Tclose(tid), "Could not close string type");
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close string dataset");
  Log::Debug("HD5", "Read string {}", name);
  return r;
}

template <> auto Reader::readStruct<Info>(std::string const &id) const -> Info
{
  hid_t const info_id = InfoType();
  hid_t const dset = H5Dopen(handle_, id.c_str(), H5P_DEFAULT);
  CheckInfoType(dset);
  hid_t const space = H5Dget_space(dset);
  Info        info;
  CheckedCall(H5Dread(dset, info_id, space, H5S_ALL, H5P_DATASET_XFER_DEFAULT, &info), "Could not read info struct");
  CheckedCall(H5Dclose(dset), "Could not close info dataset");
  return info;
}

template <> auto Reader::readStruct<AcquisitionParams>(std::string const &id) const -> AcquisitionParams
{
  hid_t const pars_id = ParamsType();
  hid_t const dset = H5Dopen(handle_, id.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Acquisition parameters {} do not exist", id); }
  hid_t const       space = H5Dget_space(dset);
  AcquisitionParams pars;
  CheckedCall(H5Dread(dset, pars_id, space, H5S_ALL, H5P_DATASET_XFER_DEFAULT, &pars), "Could not read parameters");
  CheckedCall(H5Dclose(dset), "Could not close parameter dataset");
  return pars;
}

auto Reader::exists(std::string const &label) const -> bool { return Exists(handle_, label); }

auto Reader::readMeta() const -> std::map<std::string, float>
{
  if (!Exists(handle_, Keys::Meta)) {
    Log::Debug("HD5", "No meta-data found in file handle {}", handle_);
    return {};
  }
  auto const                   meta_group = H5Gopen(handle_, Keys::Meta.c_str(), H5P_DEFAULT);
  auto const                   names = Names(meta_group);
  std::map<std::string, float> meta;
  herr_t                       status = 0;
  for (auto const &name : names) {
    hid_t const dset = H5Dopen(meta_group, name.c_str(), H5P_DEFAULT);
    float       value;
    status = H5Dread(dset, H5T_NATIVE_FLOAT, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value);
    status = H5Dclose(dset);
    meta[name] = value;
  }
  status = H5Gclose(meta_group);
  if (status != 0) { throw Log::Failure("HD5", "Could not load meta-data, code: {}", status); }
  return meta;
}

} // namespace HD5
} // namespace xr
