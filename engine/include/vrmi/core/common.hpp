#pragma once

/**
 * @file common.hpp
 * @brief Common utilities and macros for the importer
 */

#include <cstdint>
#include <string>
#include <type_traits>
#include <cpptrace/cpptrace.hpp>

#include "profiler.hpp"
#include "logger.hpp"

// ============================================================================
// Assertion Macros (Debug-only)
// ============================================================================

#ifdef DEBUG
#define VRMI_ASSERT(condition, message)                                        \
  do {                                                                         \
    if (!(condition)) {                                                        \
        std::string trace = cpptrace::generate_trace().to_string();            \
        vrmi::core::Logger::critical("ASSERTION FAILED: {}\nStack Trace:\n{}", \
            message, trace);                                                   \
      throw cpptrace::runtime_error(                                           \
          "ASSERTION FAILED: " + std::string(message) +                        \
          "\nFile: " __FILE__ "\nLine: " + std::to_string(__LINE__));          \
    }                                                                          \
  } while (0)
#else
#define VRMI_ASSERT(condition, message) (void)(0)
#endif

// ============================================================================
// Cast Helpers
// ============================================================================

namespace vrmi::util {

template <typename Enum>
constexpr auto underlying(Enum e) noexcept -> std::underlying_type_t<Enum> {
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace vrmi::util
