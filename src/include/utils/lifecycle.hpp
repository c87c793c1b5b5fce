#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Application startup and shutdown with dependency-aware modules.
 *
 * Services with process-wide state (currently the Logger) publish a `ModuleDef`.
 * The LifecycleManager sorts registered modules by their declared dependencies,
 * starts them in that order and stops them in reverse order, each shutdown bounded
 * by its own timeout.
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     testpipe::utils::LifecycleGuard app_lifecycle(
 *         testpipe::utils::MakeModDefList(testpipe::utils::Logger::GetLifecycleModule()));
 *     LOGGER_INFO("testpipe started.");
 *     ...
 * }   // FinalizeApp() runs here
 * ```
 *
 * An unknown dependency or a dependency cycle makes `initialize()` throw
 * `std::runtime_error`; so does an exception escaping a startup callback (modules
 * that already started are stopped again first).
 ******************************************************************************/
#include "tp_base.hpp"

#include <atomic>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace testpipe::utils
{

class LifecycleManagerImpl;

// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(Mods));
    (list.emplace_back(std::forward<Mods>(mods)), ...);
    return list;
}

/**
 * @class LifecycleManager
 * @brief Process-wide singleton that owns the registered modules.
 */
class TESTPIPE_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before `initialize()`; later
     *        registrations are a programming error and panic.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module in dependency order. Idempotent.
     * @throws std::runtime_error on a duplicate name, an undefined dependency, a cycle,
     *         or an exception thrown by a startup callback.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Stops started modules in reverse order. Idempotent; a no-op before
     *        `initialize()`.
     */
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
 * The first guard constructed in a process registers its modules and initializes;
 * its destructor finalizes. Later guards are no-ops and ignore their modules.
 */
class LifecycleGuard
{
  private:
    std::source_location m_loc;

  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        init_owner_if_first({});
    }

    // Usage: LifecycleGuard guard(MakeModDefList(ModuleDef("Mod1"), ModuleDef("Mod2")));
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        TP_DEBUG("[TP_LifeCycle] LifecycleGuard constructed in function {}. ({}:{})",
                 m_loc.function_name(), testpipe::format_tools::filename_only(m_loc.file_name()),
                 m_loc.line());
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    /**
     * @warning Static objects destroyed after the owning guard must not log: the Logger
     *          is already stopped by then and drops their messages.
     */
    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            testpipe::utils::FinalizeApp(m_loc);
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
                testpipe::utils::RegisterModule(std::move(m));
            }
            testpipe::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            TP_DEBUG("[TP_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an owner "
                     "already exists; provided modules were ignored. ({}:{})",
                     testpipe::platform::get_executable_name(), testpipe::platform::get_pid(),
                     testpipe::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    bool m_is_owner{false};
};

} // namespace testpipe::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
