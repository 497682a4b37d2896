#pragma once
/**
 * @file sd_service.hpp
 * @brief Layer 2: lifecycle-managed services.
 *
 * Logger, FileLock and ClientConfig are lifecycle modules and must be registered with a
 * LifecycleGuard before use. JsonStore and EventLoop are plain objects built on top of them.
 */
#include "sd_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/file_lock.hpp"
#include "utils/json_store.hpp"
#include "utils/event_loop.hpp"
#include "utils/client_config.hpp"
