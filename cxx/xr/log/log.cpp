#include "log.hpp"

#include "debug.hpp"
#include "fmt/chrono.h"

#include <cmath>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <stdio.h>
#include <unistd.h>

namespace xr {
namespace Log {

namespace {
Display                  displayLevel = Display::None;
std::mutex               logMutex;
std::vector<std::string> savedEntries;

bool        isTTY = false;
int64_t     progressTarget = -1, progressCurrent = 0, progressNext = 0;
std::mutex  progressMutex;
std::string progressMessage;

auto TheTime() -> std::string
{
  auto const t = std::time(nullptr);
  return fmt::format("{:%H:%M:%S}", fmt::localtime(t));
}
} // namespace

void SetDisplayLevel(Display const l)
{
  displayLevel = l;
  if (std::getenv("XR_NOT_TTY")) {
    isTTY = false;
  } else {
    isTTY = isatty(fileno(stderr));
  }
  // Move the cursor one more line down so we don't erase command names etc.
  if (displayLevel == Display::Ephemeral) { fmt::print(stderr, "\n"); }
}

auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  return fmt::format("[{}] [{:<6}] {}", TheTime(), category, fmt::vformat(fmt, args));
}

void SaveEntry(std::string const &s, fmt::text_style const style, Display const level)
{
  std::scoped_lock lock(logMutex);
  savedEntries.push_back(s);
  if (displayLevel >= level) {
    if (displayLevel == Display::Ephemeral) { fmt::print(stderr, "\033[A\33[2K\r"); }
    fmt::print(stderr, style, "{}\n", s);
  }
}

auto Saved() -> std::vector<std::string> const & { return savedEntries; }

void End()
{
  EndDebugging();
  displayLevel = Display::None;
}

void StartProgress(int64_t const amount, std::string const &text)
{
  std::scoped_lock lock(progressMutex);
  progressMessage = text;
  if (progressMessage.size() && displayLevel >= Display::High) {
    fmt::print(stderr, "[{}] Starting {}\n", TheTime(), progressMessage);
  }
  if (isTTY && displayLevel >= Display::Low) {
    progressTarget = amount;
    progressCurrent = 0;
    progressNext = std::floor(progressTarget / 100.f);
  }
}

void StopProgress()
{
  std::scoped_lock lock(progressMutex);
  if (isTTY && displayLevel >= Display::Low) {
    progressTarget = -1;
    fmt::print(stderr, "\x1b[2K\r");
  }
  if (progressMessage.size() && displayLevel >= Display::High) {
    fmt::print(stderr, "[{}] Finished {}\n", TheTime(), progressMessage);
  }
}

void Tick()
{
  if (isTTY && (progressTarget > 0)) {
    std::scoped_lock lock(progressMutex);
    progressCurrent++;
    if (progressCurrent > progressNext) {
      float const percent = (100.f * progressCurrent) / progressTarget;
      fmt::print(stderr, "\x1b[2K\r{:02.0f}%", percent);
      progressNext += std::floor(progressTarget / 100.f);
    }
  }
}

Time Now() { return std::chrono::high_resolution_clock::now(); }

std::string ToNow(Log::Time const t1)
{
  using ms = std::chrono::milliseconds;
  auto const t2 = std::chrono::high_resolution_clock::now();
  auto const diff = std::chrono::duration_cast<ms>(t2 - t1).count();
  auto const mins = diff / (60 * 1000);
  auto const secs = diff % (60 * 1000) / 1000;
  auto const millis = diff % 1000;
  if (mins > 0) {
    return fmt::format("{} minute{} {} second{}", mins, mins > 1 ? "s" : "", secs, secs > 1 ? "s" : "");
  } else if (secs > 0) {
    return fmt::format("{}.{:03d} seconds", secs, millis);
  } else {
    return fmt::format("{} millisecond{}", diff, diff > 1 ? "s" : "");
  }
}

} // namespace Log
} // namespace xr
