#pragma once

/**
 * @file errors.hpp
 * @brief Fatal import error types
 *
 * Every fatal import condition is thrown as one of these (or as
 * cpptrace::out_of_range for bad indices) and propagates to the caller of the
 * importer unchanged. Missing data is never reported through them.
 */

#include <cpptrace/cpptrace.hpp>
#include <string>
#include <utility>

namespace vrmi::core {

// Unrecognized sampler enumeration, contradictory sampler entries, or a
// conversion request without any source.
class ConfigurationError : public cpptrace::logic_error {
public:
  explicit ConfigurationError(std::string message)
      : cpptrace::logic_error(std::move(message)) {}
};

// Known gap of the importer (multi-mesh groups, missing VRM extension block).
class NotImplementedError : public cpptrace::logic_error {
public:
  explicit NotImplementedError(std::string message)
      : cpptrace::logic_error(std::move(message)) {}
};

} // namespace vrmi::core
