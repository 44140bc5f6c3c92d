#pragma once

/**
 * @file stop_signal.h
 * @brief SIGINT/SIGTERM handling for the interactive CLI
 */

#include "errors.h"

namespace interrupt_filter {

/**
 * Installs SIGINT and SIGTERM handlers that set the stop flag.
 * Installed without SA_RESTART, so a blocking read (std::getline on stdin)
 * fails with EINTR instead of waiting for the next line.
 */
Result<void> install_stop_handlers();

bool stop_requested();

void clear_stop_request();

} // namespace interrupt_filter
