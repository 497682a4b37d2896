#include "utils/sync_task.hpp"

namespace syncdesk::sync
{

const char *to_string(SyncErrorKind kind) noexcept
{
    switch (kind)
    {
    case SyncErrorKind::NetworkError:
        return "NetworkError";
    case SyncErrorKind::AuthExpired:
        return "AuthExpired";
    case SyncErrorKind::ValidationError:
        return "ValidationError";
    case SyncErrorKind::ServerError:
        return "ServerError";
    case SyncErrorKind::RetriesExhausted:
        return "RetriesExhausted";
    case SyncErrorKind::SyncConflict:
        return "SyncConflict";
    }
    return "Unknown";
}

const char *to_string(TaskKind kind) noexcept
{
    switch (kind)
    {
    case TaskKind::Fetch:
        return "Fetch";
    case TaskKind::Create:
        return "Create";
    case TaskKind::Update:
        return "Update";
    case TaskKind::Delete:
        return "Delete";
    }
    return "Unknown";
}

std::string SyncError::describe() const
{
    std::string out = fmt::format("{} {} on '{}'", to_string(kind), to_string(operation),
                                  entity_type);
    if (kind != cause)
        out += fmt::format(" (last cause {})", to_string(cause));
    if (http_status != 0)
        out += fmt::format(", HTTP {}", http_status);
    if (attempts > 0)
        out += fmt::format(", {} attempt(s)", attempts);
    if (!message.empty())
        out += fmt::format(": {}", message);
    return out;
}

} // namespace syncdesk::sync
