#pragma once

#include "log/log.hpp"

namespace xr {

/*
 * Failure categories raised by the simulator. All of them are Log::Failures, so front ends can catch the base type
 * and print the message, or catch a specific category to recover (e.g. disable a control that produced a bad geometry).
 */
struct GeometryError : Log::Failure
{
  template <typename... Args>
  GeometryError(fmt::format_string<Args...> fs, Args &&...args)
    : Log::Failure("Geom", fs, std::forward<Args>(args)...)
  {
  }
};

struct ProjectionError : Log::Failure
{
  template <typename... Args>
  ProjectionError(fmt::format_string<Args...> fs, Args &&...args)
    : Log::Failure("Proj", fs, std::forward<Args>(args)...)
  {
  }
};

struct IndexError : Log::Failure
{
  template <typename... Args>
  IndexError(fmt::format_string<Args...> fs, Args &&...args)
    : Log::Failure("Index", fs, std::forward<Args>(args)...)
  {
  }
};

struct DivideByZeroError : Log::Failure
{
  template <typename... Args>
  DivideByZeroError(fmt::format_string<Args...> fs, Args &&...args)
    : Log::Failure("Stats", fs, std::forward<Args>(args)...)
  {
  }
};

struct ParameterError : Log::Failure
{
  template <typename... Args>
  ParameterError(fmt::format_string<Args...> fs, Args &&...args)
    : Log::Failure("Param", fs, std::forward<Args>(args)...)
  {
  }
};

} // namespace xr
