#include "threads.hpp"

#include "../log/log.hpp"

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <unsupported/Eigen/CXX11/Tensor>
#include <unsupported/Eigen/CXX11/ThreadPool>

#include <exception>
#include <memory>
#include <mutex>
#include <thread>

namespace {
std::unique_ptr<Eigen::ThreadPool>       gp = nullptr;
std::unique_ptr<Eigen::ThreadPoolDevice> dev = nullptr;
} // namespace

namespace xr {
namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *
{
  if (gp == nullptr) {
    auto const nt = std::thread::hardware_concurrency();
    Log::Debug("Thread", "Creating default thread pool with {} threads", nt);
    gp = std::make_unique<Eigen::ThreadPool>(nt);
  }
  return gp.get();
}

void SetGlobalThreadCount(Index nt)
{
  if (nt < 1) { nt = std::thread::hardware_concurrency(); }
  Log::Debug("Thread", "Creating thread pool with {} threads", nt);
  dev.reset();
  gp = std::make_unique<Eigen::ThreadPool>(nt);
  dev = std::make_unique<Eigen::ThreadPoolDevice>(gp.get(), nt);
}

auto GlobalThreadCount() -> Index { return GlobalPool()->NumThreads(); }

auto GlobalDevice() -> Eigen::ThreadPoolDevice &
{
  if (dev == nullptr) {
    auto pool = GlobalPool();
    dev = std::make_unique<Eigen::ThreadPoolDevice>(pool, pool->NumThreads());
  }
  return *dev;
}

void For(ForFunc f, Index const lo, Index const hi, std::string const &label)
{
  Index const ni = hi - lo;
  Index const nt = GlobalPool()->NumThreads();
  if (ni <= 0) { return; }

  bool const report = label.size();
  if (report) { Log::StartProgress(ni, label); }
  if (nt == 1) {
    for (Index ii = lo; ii < hi; ii++) {
      f(ii);
      if (report) { Log::Tick(); }
    }
  } else {
    Eigen::Barrier barrier(static_cast<unsigned int>(ni));
    std::exception_ptr failure = nullptr;
    std::mutex         failureMutex;
    for (Index ii = lo; ii < hi; ii++) {
      GlobalPool()->Schedule([&barrier, &f, &failure, &failureMutex, ii, report] {
        try {
          f(ii);
        } catch (...) {
          std::scoped_lock lock(failureMutex);
          if (!failure) { failure = std::current_exception(); }
        }
        if (report) { Log::Tick(); }
        barrier.Notify();
      });
    }
    barrier.Wait();
    if (failure) {
      if (report) { Log::StopProgress(); }
      std::rethrow_exception(failure);
    }
  }
  if (report) { Log::StopProgress(); }
}

void For(ForFunc f, Index const n, std::string const &label) { For(f, 0, n, label); }

} // namespace Threads
} // namespace xr
