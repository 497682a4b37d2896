#pragma once
/**
 * @file lifecycle.hpp
 * @brief Dependency-ordered startup and shutdown of the process-wide service modules.
 *
 * Modules (Logger, FileLock, ClientConfig, ...) describe themselves with a `ModuleDef` returned
 * by their `GetLifecycleModule()`. The application hands those definitions to a
 * `LifecycleGuard` in `main()`:
 *
 * @code
 *  int main()
 *  {
 *      syncdesk::utils::LifecycleGuard guard(syncdesk::utils::MakeModDefList(
 *          syncdesk::utils::Logger::GetLifecycleModule(),
 *          syncdesk::utils::FileLock::GetLifecycleModule()));
 *      ...
 *  } // modules shut down here, in reverse dependency order
 * @endcode
 *
 * Startup failures (cycle, unknown dependency, throwing startup callback) are fatal: the status
 * of every module is printed and the process aborts. Shutdown callbacks run with a per-module
 * timeout and never block finalize() beyond it.
 */
#include "sd_base.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::utils
{

class LifecycleManagerImpl;

/// Builds a vector<ModuleDef> from rvalue ModuleDefs: MakeModDefList(std::move(a), B()).
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");
    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

class SYNCDESK_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before initialize(); later calls are ignored
     *        with a warning on stderr.
     */
    void register_module(ModuleDef &&module_def);

    /// Builds the graph and starts every module in dependency order. Runs once.
    void initialize(std::source_location loc);
    /// Shuts the started modules down in reverse order. Runs once.
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules and initializes; its
 * destructor finalizes. Any later guard is a no-op (its modules are ignored).
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first({});
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            SD_DEBUG("[SD_Lifecycle] owner guard from {} ({}:{}) finalizing.",
                     m_loc.function_name(),
                     syncdesk::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            syncdesk::utils::FinalizeApp(m_loc);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                syncdesk::utils::RegisterModule(std::move(m));
            }
            syncdesk::utils::InitializeApp(m_loc);
        }
        else
        {
            SD_DEBUG("[SD_Lifecycle] PID[{}] LifecycleGuard from {} ({}:{}) is not the owner; "
                     "its modules were ignored.",
                     syncdesk::platform::get_pid(), m_loc.function_name(),
                     syncdesk::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace syncdesk::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
