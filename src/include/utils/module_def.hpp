#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "syncdesk_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

// C4251: exported class holding a unique_ptr to an incomplete type (Pimpl).
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Startup/shutdown callback type.
 *
 * A plain function pointer keeps the calling convention stable across the shared-library
 * boundary. `arg` is `nullptr` when no argument was supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a lifecycle module: a unique name, its dependencies, and the startup and
 *        shutdown callbacks.
 *
 * Movable, not copyable. Ownership passes to the LifecycleManager on registration.
 * Names longer than `MAX_MODULE_NAME_LEN` are rejected with `std::length_error`.
 */
class SYNCDESK_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief The named module is started before this one and shut down after it.
     *        An empty name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @param timeout Maximum time the callback may run before its thread is detached.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace syncdesk::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
