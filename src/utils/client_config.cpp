/**
 * @file client_config.cpp
 * @brief ClientConfig lifecycle module: layered load of client.default.json,
 *        client.user.json, SYNCDESK_CONFIG_FILE and environment overrides.
 */
#include "sd_service.hpp"

#include <atomic>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace syncdesk
{

namespace fs = std::filesystem;

static std::atomic<bool> g_client_config_initialized{false};

static std::mutex g_config_dir_mu;
static fs::path g_config_dir_override;

namespace
{

fs::path discover_config_dir()
{
    const fs::path exe = platform::get_executable_name(true);
    if (exe.empty() || exe == "unknown")
        return {};
    const fs::path bin = exe.parent_path();
    std::error_code ec;
    for (const auto &candidate : {bin / ".." / "config", bin / "config"})
    {
        if (fs::is_directory(candidate, ec))
            return fs::weakly_canonical(candidate, ec);
    }
    return {};
}

fs::path resolve_path(const fs::path &base_dir, const std::string &raw)
{
    if (raw.empty())
        return {};
    fs::path p(raw);
    if (p.is_absolute() || base_dir.empty())
        return p.lexically_normal();
    return (base_dir / p).lexically_normal();
}

template <typename T> T get_as(const nlohmann::json &obj, const char *section, const char *key)
{
    try
    {
        return obj.at(key).get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(
            fmt::format("config: invalid value for '{}.{}': {}", section, key, e.what()));
    }
}

std::chrono::milliseconds get_ms(const nlohmann::json &obj, const char *section, const char *key)
{
    const auto v = get_as<int64_t>(obj, section, key);
    if (v < 0)
        throw std::runtime_error(fmt::format("config: '{}.{}' must not be negative", section, key));
    return std::chrono::milliseconds(v);
}

std::chrono::seconds get_s(const nlohmann::json &obj, const char *section, const char *key)
{
    const auto v = get_as<int64_t>(obj, section, key);
    if (v < 0)
        throw std::runtime_error(fmt::format("config: '{}.{}' must not be negative", section, key));
    return std::chrono::seconds(v);
}

int get_positive_int(const nlohmann::json &obj, const char *section, const char *key, int min)
{
    const auto v = get_as<int>(obj, section, key);
    if (v < min)
        throw std::runtime_error(
            fmt::format("config: '{}.{}' must be at least {}", section, key, min));
    return v;
}

const nlohmann::json *section_of(const nlohmann::json &j, const char *name)
{
    if (!j.contains(name))
        return nullptr;
    const auto &s = j.at(name);
    if (!s.is_object())
        throw std::runtime_error(fmt::format("config: section '{}' must be an object", name));
    return &s;
}

void check_one_of(const std::string &value, const char *what,
                  std::initializer_list<const char *> allowed)
{
    for (const char *a : allowed)
    {
        if (value == a)
            return;
    }
    throw std::runtime_error(fmt::format("config: unsupported {} '{}'", what, value));
}

nlohmann::json read_config_file(const fs::path &path)
{
    nlohmann::json j;
    std::error_code ec;
    if (!utils::read_json_file(path, j, &ec))
    {
        throw std::runtime_error(
            fmt::format("config: cannot parse '{}': {}", path.string(), ec.message()));
    }
    if (!j.is_object())
        throw std::runtime_error(fmt::format("config: '{}' is not a JSON object", path.string()));
    return j;
}

} // namespace

void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    if (!base.is_object())
        base = nlohmann::json::object();
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
            json_merge(base[it.key()], it.value());
        else
            base[it.key()] = it.value();
    }
}

ClientSettings ClientSettings::from_json(const nlohmann::json &j, const ClientSettings &base,
                                         const fs::path &base_dir)
{
    if (!j.is_object())
        throw std::runtime_error("config: top level must be a JSON object");
    ClientSettings s = base;

    if (const auto *w = section_of(j, "worker"))
    {
        if (w->contains("argv"))
        {
            s.worker.argv = get_as<std::vector<std::string>>(*w, "worker", "argv");
            if (s.worker.argv.empty())
                throw std::runtime_error("config: 'worker.argv' must not be empty");
        }
        if (w->contains("working_dir"))
            s.worker.working_dir =
                resolve_path(base_dir, get_as<std::string>(*w, "worker", "working_dir"));
        if (w->contains("env"))
            s.worker.env = get_as<std::map<std::string, std::string>>(*w, "worker", "env");
        if (w->contains("ready_markers"))
            s.worker.ready_markers =
                get_as<std::vector<std::string>>(*w, "worker", "ready_markers");
        if (w->contains("start_timeout_ms"))
            s.worker.start_timeout = get_ms(*w, "worker", "start_timeout_ms");
        if (w->contains("stop_grace_ms"))
            s.worker.stop_grace = get_ms(*w, "worker", "stop_grace_ms");
    }
    if (const auto *r = section_of(j, "remote"))
    {
        if (r->contains("base_url"))
            s.remote.base_url = get_as<std::string>(*r, "remote", "base_url");
        if (r->contains("request_timeout_ms"))
            s.remote.request_timeout = get_ms(*r, "remote", "request_timeout_ms");
    }
    if (const auto *y = section_of(j, "sync"))
    {
        if (y->contains("max_concurrent"))
            s.sync.max_concurrent = get_positive_int(*y, "sync", "max_concurrent", 1);
        if (y->contains("base_delay_ms"))
            s.sync.base_delay = get_ms(*y, "sync", "base_delay_ms");
        if (y->contains("read_cap_ms"))
            s.sync.read_cap = get_ms(*y, "sync", "read_cap_ms");
        if (y->contains("write_cap_ms"))
            s.sync.write_cap = get_ms(*y, "sync", "write_cap_ms");
        if (y->contains("read_max_retries"))
            s.sync.read_max_retries = get_positive_int(*y, "sync", "read_max_retries", 0);
        if (y->contains("write_max_retries"))
            s.sync.write_max_retries = get_positive_int(*y, "sync", "write_max_retries", 0);
        if (y->contains("auth_cooldown_ms"))
            s.sync.auth_cooldown = get_ms(*y, "sync", "auth_cooldown_ms");
    }
    if (const auto *c = section_of(j, "cache"))
    {
        if (c->contains("ttl_ms"))
            s.cache.ttl = get_ms(*c, "cache", "ttl_ms");
        if (c->contains("channel"))
        {
            s.cache.channel = get_as<std::string>(*c, "cache", "channel");
            check_one_of(s.cache.channel, "cache channel", {"memory", "file"});
        }
        if (c->contains("channel_path"))
            s.cache.channel_path =
                resolve_path(base_dir, get_as<std::string>(*c, "cache", "channel_path"));
        if (c->contains("inflight_stale_ms"))
            s.cache.inflight_stale = get_ms(*c, "cache", "inflight_stale_ms");
        if (c->contains("peer_wait_ms"))
            s.cache.peer_wait = get_ms(*c, "cache", "peer_wait_ms");
        if (c->contains("poll_interval_ms"))
            s.cache.poll_interval = get_ms(*c, "cache", "poll_interval_ms");
    }
    if (const auto *k = section_of(j, "clock"))
    {
        if (k->contains("skew_threshold_s"))
            s.clock.skew_threshold = get_s(*k, "clock", "skew_threshold_s");
        if (k->contains("policy"))
        {
            s.clock.policy = get_as<std::string>(*k, "clock", "policy");
            check_one_of(s.clock.policy, "clock policy", {"rebase", "clamp"});
        }
        if (k->contains("session_tolerance_s"))
            s.clock.session_tolerance = get_s(*k, "clock", "session_tolerance_s");
    }
    if (const auto *p = section_of(j, "polling"))
    {
        if (p->contains("time_entries_s"))
            s.polling.time_entries = get_s(*p, "polling", "time_entries_s");
        if (p->contains("sync_status_s"))
            s.polling.sync_status = get_s(*p, "polling", "sync_status_s");
    }
    if (const auto *l = section_of(j, "logging"))
    {
        if (l->contains("level"))
        {
            s.logging.level = get_as<std::string>(*l, "logging", "level");
            check_one_of(s.logging.level, "log level",
                         {"trace", "debug", "info", "warn", "error", "system"});
        }
        if (l->contains("file"))
            s.logging.file = resolve_path(base_dir, get_as<std::string>(*l, "logging", "file"));
    }
    return s;
}

// ---------------------------------------------------------------------------
// ClientConfig::Impl
// ---------------------------------------------------------------------------

struct ClientConfig::Impl
{
    ClientSettings settings;
    fs::path config_dir;
    nlohmann::json merged = nlohmann::json::object();

    void apply_layer(const fs::path &file, const char *label)
    {
        std::error_code ec;
        if (!fs::exists(file, ec))
        {
            LOGGER_INFO("ClientConfig: no {} at '{}'", label, file.string());
            return;
        }
        LOGGER_INFO("ClientConfig: loading {} '{}'", label, file.string());
        const auto j = read_config_file(file);
        settings = ClientSettings::from_json(j, settings, file.parent_path());
        json_merge(merged, j);
    }

    void apply_env()
    {
        if (const char *env = std::getenv("SYNCDESK_API_BASE_URL"))
            settings.remote.base_url = env;
        if (const char *env = std::getenv("SYNCDESK_LOG_LEVEL"))
        {
            settings = ClientSettings::from_json(
                nlohmann::json{{"logging", {{"level", std::string(env)}}}}, settings);
        }
        if (const char *env = std::getenv("SYNCDESK_LOG_FILE"))
            settings.logging.file = env;
        if (const char *env = std::getenv("SYNCDESK_WORKER_DIR"))
            settings.worker.working_dir = env;
        if (const char *env = std::getenv("SYNCDESK_CACHE_PATH"))
        {
            settings.cache.channel_path = env;
            settings.cache.channel = "file";
        }
    }
};

ClientConfig::ClientConfig() : pImpl(std::make_unique<Impl>()) {}
ClientConfig::~ClientConfig() = default;

void ClientConfig::load_(const fs::path &explicit_dir)
{
    pImpl->config_dir = explicit_dir.empty() ? discover_config_dir() : explicit_dir;
    if (!pImpl->config_dir.empty())
    {
        pImpl->apply_layer(pImpl->config_dir / "client.default.json", "defaults");
        pImpl->apply_layer(pImpl->config_dir / "client.user.json", "user overrides");
    }
    else
    {
        LOGGER_INFO("ClientConfig: no config directory found; using built-in defaults");
    }
    if (const char *env = std::getenv("SYNCDESK_CONFIG_FILE"))
    {
        pImpl->apply_layer(fs::path(env), "SYNCDESK_CONFIG_FILE");
    }
    pImpl->apply_env();

    const auto &s = pImpl->settings;
    LOGGER_INFO("ClientConfig: config_dir     = {}", pImpl->config_dir.string());
    LOGGER_INFO("ClientConfig: base_url       = {}", s.remote.base_url);
    LOGGER_INFO("ClientConfig: worker argv[0] = {}", s.worker.argv.front());
    LOGGER_INFO("ClientConfig: cache channel  = {} {}", s.cache.channel,
                s.cache.channel_path.string());
}

const ClientSettings &ClientConfig::settings() const noexcept
{
    return pImpl->settings;
}

const fs::path &ClientConfig::config_dir() const noexcept
{
    return pImpl->config_dir;
}

const nlohmann::json &ClientConfig::raw() const noexcept
{
    return pImpl->merged;
}

ClientConfig &ClientConfig::instance()
{
    if (!lifecycle_initialized())
    {
        SD_PANIC("ClientConfig::instance() called before the ClientConfig module was "
                 "initialized via LifecycleManager.");
    }
    static ClientConfig instance;
    return instance;
}

void ClientConfig::set_config_dir(const fs::path &dir)
{
    std::lock_guard<std::mutex> lock(g_config_dir_mu);
    g_config_dir_override = dir;
}

bool ClientConfig::lifecycle_initialized() noexcept
{
    return g_client_config_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_client_config_startup(const char *arg)
{
    fs::path dir;
    {
        std::lock_guard<std::mutex> lock(g_config_dir_mu);
        dir = g_config_dir_override;
    }
    if (dir.empty() && arg != nullptr)
        dir = arg;
    // Flag first: instance() is guarded by it. A throwing load aborts the lifecycle anyway.
    g_client_config_initialized.store(true, std::memory_order_release);
    ClientConfig::instance().load_(dir);
}

void do_client_config_shutdown(const char *arg)
{
    (void)arg;
    g_client_config_initialized.store(false, std::memory_order_release);
}
} // namespace

utils::ModuleDef ClientConfig::GetLifecycleModule()
{
    utils::ModuleDef module("syncdesk::ClientConfig");
    module.add_dependency("syncdesk::utils::Logger");
    module.set_startup(&do_client_config_startup);
    module.set_shutdown(&do_client_config_shutdown, std::chrono::milliseconds(1000));
    return module;
}

} // namespace syncdesk
