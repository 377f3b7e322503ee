#pragma once

/// @file logging.hpp
/// @brief Console logging setup for programs embedding the library
///
/// The library writes through plog's default logger and never initializes it.
/// Applications that want the library's diagnostics call init_console() or
/// plog::init() with their own appenders.

#include <plog/Severity.h>

namespace reconcile {
namespace logging {

/// @brief Routes the default plog logger to stdout
///
/// Calling it again only changes the maximum severity.
void init_console(plog::Severity severity = plog::info);

}  // namespace logging
}  // namespace reconcile
