/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * 1.  `register_module()` collects `ModuleDef`s until `initialize()`.
 * 2.  `initialize()` builds the graph, rejects duplicates, unknown dependencies and cycles,
 *     and starts the modules in topological order. Any failure aborts the process.
 * 3.  `finalize()` shuts the started modules down in reverse order. Each shutdown callback
 *     runs on its own thread with a deadline (thread+flag+poll+detach), so a hung module can
 *     not block process exit.
 ******************************************************************************/
#include "sd_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <chrono>
#include <fmt/ranges.h>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace
{

void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > syncdesk::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(syncdesk::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

/**
 * @brief Runs `func` on a thread and waits at most `timeout`.
 *
 * std::async is not used: its future's destructor blocks until the task ends. On timeout the
 * thread is detached, which is acceptable because finalize() runs at process exit.
 * A zero timeout waits for completion.
 */
ShutdownOutcome timed_shutdown(const std::function<void()> &func, std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    auto completed = std::make_shared<std::atomic<bool>>(false);
    auto error = std::make_shared<std::string>();
    auto failed = std::make_shared<std::atomic<bool>>(false);
    std::thread thread(
        [func, completed, error, failed]()
        {
            try
            {
                func();
            }
            catch (const std::exception &e)
            {
                *error = e.what();
                failed->store(true, std::memory_order_release);
            }
            completed->store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!completed->load(std::memory_order_acquire))
    {
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }
    thread.join();

    if (failed->load(std::memory_order_acquire))
    {
        return {false, false, *error};
    }
    return {true, false, {}};
}

} // namespace

namespace syncdesk::utils
{

class ModuleDefImpl
{
  public:
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
    std::chrono::milliseconds shutdown_timeout{0};
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl != nullptr && !dependency_name.empty())
    {
        validate_module_name(dependency_name, "dependency name");
        pImpl->dependencies.emplace_back(dependency_name);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error("Lifecycle: startup argument exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->startup = [startup_func, arg_copy = std::string(arg)]()
        { startup_func(arg_copy.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->shutdown = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->shutdown_timeout = timeout;
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error("Lifecycle: shutdown argument exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->shutdown = [shutdown_func, arg_copy = std::string(arg)]()
        { shutdown_func(arg_copy.c_str()); };
        pImpl->shutdown_timeout = timeout;
    }
}

class LifecycleManagerImpl
{
  public:
    enum class ModuleStatus
    {
        Registered,
        Started,
        Failed,
        Shutdown,
        FailedShutdown,
        ShutdownTimeout
    };

    struct GraphNode
    {
        ModuleDefImpl def;
        std::vector<GraphNode *> dependents;
        ModuleStatus status = ModuleStatus::Registered;
    };

    LifecycleManagerImpl()
        : m_pid(syncdesk::platform::get_pid()),
          m_app_name(syncdesk::platform::get_executable_name())
    {
    }

    void register_module(ModuleDefImpl def)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_is_initialized.load(std::memory_order_acquire))
        {
            fmt::print(stderr,
                       "[SD_Lifecycle] [{}]:PID[{}] WARNING: module '{}' registered after "
                       "initialize(); ignored.\n",
                       m_app_name, m_pid, def.name);
            return;
        }
        m_registered.push_back(std::move(def));
    }

    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};

  private:
    void build_graph();
    std::vector<GraphNode *> topological_sort();
    [[noreturn]] void print_status_and_abort(const std::string &msg, const std::string &mod = "");

    const uint64_t m_pid;
    const std::string m_app_name;
    std::mutex m_mutex;
    std::vector<ModuleDefImpl> m_registered;
    std::map<std::string, GraphNode> m_graph;
    std::vector<GraphNode *> m_startup_order;
};

void LifecycleManagerImpl::build_graph()
{
    for (auto &def : m_registered)
    {
        if (m_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        const std::string name = def.name;
        m_graph[name].def = std::move(def);
    }
    m_registered.clear();
    for (auto &[name, node] : m_graph)
    {
        for (const auto &dep_name : node.def.dependencies)
        {
            auto iter = m_graph.find(dep_name);
            if (iter == m_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name);
            }
            iter->second.dependents.push_back(&node);
        }
    }
}

// Kahn's algorithm; leftover nodes with a non-zero in-degree form a cycle.
std::vector<LifecycleManagerImpl::GraphNode *> LifecycleManagerImpl::topological_sort()
{
    std::map<GraphNode *, size_t> in_degrees;
    for (auto &[name, node] : m_graph)
    {
        in_degrees.emplace(&node, node.def.dependencies.size());
    }

    std::vector<GraphNode *> order;
    order.reserve(m_graph.size());
    for (auto &[node, degree] : in_degrees)
    {
        if (degree == 0)
        {
            order.push_back(node);
        }
    }
    for (size_t head = 0; head < order.size(); ++head)
    {
        for (GraphNode *dependent : order[head]->dependents)
        {
            if (--in_degrees[dependent] == 0)
            {
                order.push_back(dependent);
            }
        }
    }

    if (order.size() != m_graph.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(node->def.name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return order;
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    SD_DEBUG("[SD_Lifecycle] [{}]:PID[{}] initialize() from {} ({}:{})", m_app_name, m_pid,
             loc.function_name(), syncdesk::format_tools::filename_only(loc.file_name()),
             loc.line());
    (void)loc;

    try
    {
        build_graph();
        m_startup_order = topological_sort();
    }
    catch (const std::runtime_error &e)
    {
        print_status_and_abort(e.what());
    }

    for (auto *mod : m_startup_order)
    {
        try
        {
            if (mod->def.startup)
            {
                mod->def.startup();
            }
            mod->status = ModuleStatus::Started;
            SD_DEBUG("[SD_Lifecycle]   -> started '{}'", mod->def.name);
        }
        catch (const std::exception &e)
        {
            mod->status = ModuleStatus::Failed;
            print_status_and_abort("Exception during startup: " + std::string(e.what()),
                                   mod->def.name);
        }
    }
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    SD_DEBUG("[SD_Lifecycle] [{}]:PID[{}] finalize() for guard from {} ({}:{})", m_app_name,
             m_pid, loc.function_name(), syncdesk::format_tools::filename_only(loc.file_name()),
             loc.line());
    (void)loc;

    for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
    {
        GraphNode *mod = *it;
        if (mod->status != ModuleStatus::Started)
        {
            continue;
        }
        auto outcome = timed_shutdown(mod->def.shutdown, mod->def.shutdown_timeout);
        if (outcome.success)
        {
            mod->status = ModuleStatus::Shutdown;
        }
        else if (outcome.timed_out)
        {
            mod->status = ModuleStatus::ShutdownTimeout;
            fmt::print(stderr,
                       "[SD_Lifecycle] [{}]:PID[{}] module '{}' did not shut down within {}ms; "
                       "thread detached.\n",
                       m_app_name, m_pid, mod->def.name, mod->def.shutdown_timeout.count());
        }
        else
        {
            mod->status = ModuleStatus::FailedShutdown;
            fmt::print(stderr, "[SD_Lifecycle] [{}]:PID[{}] module '{}' threw on shutdown: {}\n",
                       m_app_name, m_pid, mod->def.name, outcome.exception_msg);
        }
    }
}

void LifecycleManagerImpl::print_status_and_abort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[SD_Lifecycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[SD_Lifecycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "\n--- Module Status ---\n");
    for (auto const &[name, node] : m_graph)
    {
        const char *status = node.status == ModuleStatus::Started  ? "Started"
                             : node.status == ModuleStatus::Failed ? "Failed"
                                                                   : "Registered";
        fmt::print(stderr, "  - '{}' [{}]\n", name, status);
    }
    fmt::print(stderr, "---------------------\n\n");
    syncdesk::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// ---------------------------------------------------------------------------
// LifecycleManager public API
// ---------------------------------------------------------------------------

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    if (module_def.pImpl)
    {
        pImpl->register_module(std::move(*module_def.pImpl));
    }
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->m_is_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized()
{
    return pImpl->m_is_finalized.load(std::memory_order_acquire);
}

} // namespace syncdesk::utils
