#pragma once

#include "hd5-core.hpp"

#include <map>
#include <string>

namespace xr {
namespace HD5 {

/*
 * Reads maps, radiographs and sinograms back out of files written by Writer.
 */
struct Reader
{
  Reader(Reader const &) = delete;
  Reader(std::string const &fname);
  ~Reader();

  auto list() const -> std::vector<std::string>;                         // List all top-level objects
  auto exists(std::string const &label) const -> bool;                  // Does a data-set exist?
  auto order(std::string const &label) const -> Index;                  // Determine order of tensor dataset
  auto dimensions(std::string const &label) const -> std::vector<Index>; // Get Tensor dimensions
  auto listNames(std::string const &label) const -> std::vector<std::string>; // Get dimension names

  auto readString(std::string const &label) const -> std::string;
  auto readMeta() const -> std::map<std::string, float>; // Read meta-data group

  template <typename T> auto readStruct(std::string const &) const -> T;
  template <typename T> auto readTensor(std::string const &label) const -> T;

protected:
  Handle handle_;
};

} // namespace HD5
} // namespace xr
