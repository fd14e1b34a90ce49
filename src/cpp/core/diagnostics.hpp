#ifndef SPACECRAFT_TOOLS_DIAGNOSTICS_HPP
#define SPACECRAFT_TOOLS_DIAGNOSTICS_HPP

/**
 * @file diagnostics.hpp
 * @brief Process-wide warning channel for recoverable input errors
 *
 * The models never throw on a degenerate input such as a zero sun distance.
 * They report it here and return an empty result instead. Warnings are
 * formatted as
 *
 *   [WARNING - <source>] - <message>
 *
 * and delivered to a replaceable handler (stderr by default). All functions
 * are thread-safe.
 *
 * The handler is invoked without the channel lock held, so it may call back
 * into this API, and it may run on several threads at once. Handlers must
 * not throw: the models warn from inside OpenMP parallel loops, where an
 * escaping exception terminates the program.
 */

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace spacecraft::core {

/// Receives one fully formatted warning line (no trailing newline)
using WarningHandler = std::function<void(const std::string&)>;

/**
 * @brief Emit a warning
 *
 * Does nothing while warnings are disabled.
 *
 * @param source Name of the operation raising the warning
 * @param message Human-readable description of the condition
 */
void warn(std::string_view source, std::string_view message);

/**
 * @brief Install a warning handler
 *
 * An empty handler restores the default stderr handler.
 *
 * @param handler New handler
 * @return The previously installed handler
 */
WarningHandler set_warning_handler(WarningHandler handler);

/// Enable or disable warning output globally (enabled by default)
void set_warnings_enabled(bool enabled);

/// Whether warnings are currently delivered
bool warnings_enabled();

/// Number of warnings delivered since start-up or the last reset
std::size_t warning_count();

/// Reset the delivered-warning counter to zero
void reset_warning_count();

}  // namespace spacecraft::core

#endif  // SPACECRAFT_TOOLS_DIAGNOSTICS_HPP
