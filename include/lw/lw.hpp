#pragma once

/// @file lw.hpp
/// @brief Umbrella header for the locwatch library.

#include "lw/version.hpp"

#include "lw/core/result.hpp"

#include "lw/foundation/channel.hpp"
#include "lw/foundation/config_snapshot.hpp"
#include "lw/foundation/error_code.hpp"
#include "lw/foundation/watch_error.hpp"
#include "lw/foundation/watch_logger.hpp"
#include "lw/foundation/watch_result.hpp"

#include "lw/watch/backoff.hpp"
#include "lw/watch/file_info.hpp"
#include "lw/watch/location.hpp"
#include "lw/watch/location_watcher.hpp"
#include "lw/watch/watch_event.hpp"

#include "lw/debounce/accumulators.hpp"
#include "lw/debounce/debounce_stage.hpp"

#include "lw/config/config_loader.hpp"
