#pragma once

#include "../types.hpp"
#include <functional>
#include <string>

// Forward declare
namespace Eigen {
class ThreadPoolDevice;
} // namespace Eigen

namespace xr {

namespace Threads {

auto GlobalThreadCount() -> Index;
void SetGlobalThreadCount(Index n_threads);
auto GlobalDevice() -> Eigen::ThreadPoolDevice &;

using ForFunc = std::function<void(Index const index)>;
void For(ForFunc f, Index const n, std::string const &label = "");
void For(ForFunc f, Index const lo, Index const hi, std::string const &label = "");

} // namespace Threads
} // namespace xr
