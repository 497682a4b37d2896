#pragma once
/**
 * @file sync_task.hpp
 * @brief The unit of work of the SyncTaskScheduler and its error vocabulary.
 */
#include "sd_base.hpp"
#include "utils/remote_transport.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace syncdesk::sync
{

enum class SyncErrorKind
{
    NetworkError,     ///< no HTTP response: transport failure or timeout
    AuthExpired,      ///< 401 that a token refresh could not cure
    ValidationError,  ///< 4xx other than 401, never retried
    ServerError,      ///< 5xx
    RetriesExhausted, ///< a retryable cause persisted past the retry budget
    SyncConflict      ///< stale response discarded; callers treat it as silent
};

enum class TaskKind
{
    Fetch,
    Create,
    Update,
    Delete
};

SYNCDESK_UTILS_EXPORT const char *to_string(SyncErrorKind kind) noexcept;
SYNCDESK_UTILS_EXPORT const char *to_string(TaskKind kind) noexcept;

[[nodiscard]] inline bool is_write(TaskKind kind) noexcept
{
    return kind != TaskKind::Fetch;
}

/**
 * @brief What went wrong with a task, with enough context to report it.
 *
 * For `RetriesExhausted`, `cause` holds the last underlying error (`NetworkError` or
 * `ServerError`); for every other kind `cause == kind`.
 */
struct SYNCDESK_UTILS_EXPORT SyncError
{
    SyncErrorKind kind{SyncErrorKind::NetworkError};
    SyncErrorKind cause{SyncErrorKind::NetworkError};
    int http_status{0};
    std::string entity_type;
    TaskKind operation{TaskKind::Fetch};
    std::string message;
    int attempts{0};

    [[nodiscard]] std::string describe() const;
};

/// Outcome of one task: the response body or the error.
using TaskResult = utils::Result<nlohmann::json, SyncError>;

struct SyncTask
{
    uint64_t id{0};
    TaskKind kind{TaskKind::Fetch};
    std::string entity_type;
    /// Empty for Fetch; the client-side id for Create.
    std::string entity_id;
    nlohmann::json payload;
    int retry_count{0};
    std::chrono::steady_clock::time_point next_attempt_at{};
    /// Logical timestamp of the local mutation; 0 for Fetch.
    uint64_t mutation_seq{0};
    /// Replaces the catalogue route (non-CRUD endpoints such as `POST /time-entries/start`).
    std::optional<HttpRequest> request;
};

} // namespace syncdesk::sync
