#pragma once
/**
 * @file sd_sync.hpp
 * @brief Layer 3: the synchronization engine.
 *
 * Worker supervision, the remote task scheduler and the shared entity caches, plus the clock
 * handling the time-tracking display depends on. Everything here is a plain object owned by the
 * host; only the layer 2 services below it are lifecycle modules.
 */
#include "sd_service.hpp"

#include "utils/clock_normalizer.hpp"
#include "utils/active_session.hpp"
#include "utils/process_terminator.hpp"
#include "utils/process_supervisor.hpp"
#include "utils/remote_transport.hpp"
#include "utils/curl_transport.hpp"
#include "utils/remote_endpoints.hpp"
#include "utils/auth_session.hpp"
#include "utils/sync_task.hpp"
#include "utils/sync_task_scheduler.hpp"
#include "utils/cache_channel.hpp"
#include "utils/cache_registry.hpp"
#include "utils/entity_models.hpp"
#include "utils/typed_cache.hpp"
