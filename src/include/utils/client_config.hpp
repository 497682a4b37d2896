#pragma once
/**
 * @file client_config.hpp
 * @brief ClientConfig: layered, read-only client configuration (lifecycle module).
 *
 * Sources, lowest priority first:
 *  1. built-in defaults (the member initializers of ClientSettings);
 *  2. `<config_dir>/client.default.json`;
 *  3. `<config_dir>/client.user.json`;
 *  4. the file named by `SYNCDESK_CONFIG_FILE`, if set;
 *  5. `SYNCDESK_API_BASE_URL`, `SYNCDESK_LOG_LEVEL`, `SYNCDESK_LOG_FILE`,
 *     `SYNCDESK_WORKER_DIR`, `SYNCDESK_CACHE_PATH`.
 *
 * `config_dir` is the path given to `set_config_dir()` or, failing that, `<exe>/../config` or
 * `<exe>/config`. Relative paths inside a file are resolved against the file's directory.
 *
 * Values are fixed once the module has started; `ClientConfig::instance().settings()` may be
 * read from any thread.
 */
#include "sd_base.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk
{

struct WorkerSettings
{
    std::vector<std::string> argv{"python", "-m", "api.main"};
    std::filesystem::path working_dir;
    std::map<std::string, std::string> env{{"SYNCDESK_WORKER", "1"}};
    std::vector<std::string> ready_markers{"Time Tracker API started successfully",
                                           "Application startup complete"};
    std::chrono::milliseconds start_timeout{10000};
    std::chrono::milliseconds stop_grace{3000};
};

struct RemoteSettings
{
    std::string base_url{"http://localhost:8000"};
    std::chrono::milliseconds request_timeout{10000};
};

struct SyncSettings
{
    int max_concurrent{4};
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds read_cap{16000};
    std::chrono::milliseconds write_cap{4000};
    int read_max_retries{5};
    int write_max_retries{3};
    std::chrono::milliseconds auth_cooldown{10000};
};

struct CacheSettings
{
    std::chrono::milliseconds ttl{30000};
    std::string channel{"memory"}; ///< "memory" or "file"
    std::filesystem::path channel_path;
    std::chrono::milliseconds inflight_stale{60000};
    std::chrono::milliseconds peer_wait{15000};
    std::chrono::milliseconds poll_interval{250};
};

struct ClockSettings
{
    std::chrono::seconds skew_threshold{7 * 3600};
    std::string policy{"rebase"}; ///< "rebase" or "clamp"
    std::chrono::seconds session_tolerance{10};
};

struct PollingSettings
{
    std::chrono::seconds time_entries{30};
    std::chrono::seconds sync_status{60};
};

struct LoggingSettings
{
    std::string level{"info"};
    std::filesystem::path file; ///< Empty: console.
};

struct SYNCDESK_UTILS_EXPORT ClientSettings
{
    WorkerSettings worker;
    RemoteSettings remote;
    SyncSettings sync;
    CacheSettings cache;
    ClockSettings clock;
    PollingSettings polling;
    LoggingSettings logging;

    /**
     * @brief Returns `base` with every key present in `j` applied on top.
     *
     * Pure: no environment, no filesystem. Relative paths are resolved against `base_dir`
     * when it is non-empty.
     * @throws std::runtime_error on a value of the wrong type or out of range.
     */
    static ClientSettings from_json(const nlohmann::json &j, const ClientSettings &base = {},
                                    const std::filesystem::path &base_dir = {});
};

/**
 * @brief Recursively merges `overrides` into `base`: objects merge key by key, any other
 *        value (arrays included) replaces.
 */
SYNCDESK_UTILS_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);

class SYNCDESK_UTILS_EXPORT ClientConfig
{
  public:
    /// Must be called before the lifecycle starts the module.
    static void set_config_dir(const std::filesystem::path &dir);

    static utils::ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

    /// Panics if the module has not started.
    static ClientConfig &instance();

    [[nodiscard]] const ClientSettings &settings() const noexcept;
    /// Empty when no configuration directory was found.
    [[nodiscard]] const std::filesystem::path &config_dir() const noexcept;
    /// The merged JSON of every file layer, for keys without a typed accessor.
    [[nodiscard]] const nlohmann::json &raw() const noexcept;

    ClientConfig(const ClientConfig &) = delete;
    ClientConfig &operator=(const ClientConfig &) = delete;

    /// @internal Called by the lifecycle startup callback.
    void load_(const std::filesystem::path &explicit_dir);

  private:
    ClientConfig();
    ~ClientConfig();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace syncdesk

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
