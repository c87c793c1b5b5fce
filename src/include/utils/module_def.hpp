#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "testpipe_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace testpipe::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Startup/shutdown callback. `arg` is `nullptr` when no argument was supplied.
 *
 * A C function pointer crosses the shared-library boundary with a fixed calling
 * convention; keep it that way.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a lifecycle module: a unique name, the names it depends on,
 *        a startup callback and a shutdown callback with a timeout.
 *
 * Movable, not copyable. Registering a ModuleDef transfers it to the LifecycleManager.
 * Names longer than `MAX_MODULE_NAME_LEN` are rejected with `std::length_error`.
 */
class TESTPIPE_UTILS_EXPORT ModuleDef
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

    /// The named module starts before this one and stops after it. Empty names are ignored.
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @param timeout Maximum time the callback may take; after that the shutdown thread
     *                is detached and finalization moves on.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace testpipe::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
