/*******************************************************************************
 * @file lifecycle.cpp
 * @brief ModuleDef and the LifecycleManager.
 *
 * `initialize()` orders the registered modules depth-first (dependencies before
 * dependents, otherwise registration order) and runs each startup callback.
 * `finalize()` walks the same order backwards; each shutdown callback runs on a
 * helper thread bounded by the module's timeout.
 ******************************************************************************/
#include "utils/lifecycle.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace
{
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > testpipe::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(testpipe::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

enum class StopResult
{
    Done,
    Threw,
    TimedOut
};

struct StopOutcome
{
    StopResult result;
    std::string error;
};

// A timeout <= 0 waits for the callback however long it takes.
StopOutcome run_shutdown(const std::function<void()> &func, std::chrono::milliseconds timeout)
{
    if (!func)
        return {StopResult::Done, {}};

    auto finished = std::make_shared<std::promise<std::string>>();
    auto outcome = finished->get_future();
    std::thread worker(
        [func, finished]()
        {
            try
            {
                func();
                finished->set_value({});
            }
            catch (const std::exception &e)
            {
                finished->set_value(e.what());
            }
        });

    if (timeout.count() > 0 && outcome.wait_for(timeout) == std::future_status::timeout)
    {
        // The callback may still finish later; it only touches the shared promise.
        worker.detach();
        return {StopResult::TimedOut, {}};
    }
    worker.join();
    std::string error = outcome.get();
    if (error.empty())
        return {StopResult::Done, {}};
    return {StopResult::Threw, std::move(error)};
}

} // namespace

namespace testpipe::utils
{

namespace lifecycle_internal
{
struct InternalModuleShutdownDef
{
    std::function<void()> func;
    std::chrono::milliseconds timeout{0};
};

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    InternalModuleShutdownDef shutdown;
};
} // namespace lifecycle_internal

class ModuleDefImpl
{
  public:
    lifecycle_internal::InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl != nullptr && !dependency_name.empty())
    {
        validate_module_name(dependency_name, "dependency name");
        pImpl->def.dependencies.emplace_back(dependency_name);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: startup argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.startup = [startup_func, arg_copy = std::string(arg)]()
        { startup_func(arg_copy.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->def.shutdown.func = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: shutdown argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.shutdown.func = [shutdown_func, arg_copy = std::string(arg)]()
        { shutdown_func(arg_copy.c_str()); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

class LifecycleManagerImpl
{
  public:
    struct Module
    {
        lifecycle_internal::InternalModuleDef def;
        bool started = false;
    };

    LifecycleManagerImpl()
        : m_app_name(testpipe::platform::get_executable_name()),
          m_pid(testpipe::platform::get_pid())
    {
    }

    void registerModule(lifecycle_internal::InternalModuleDef def)
    {
        if (m_is_initialized.load(std::memory_order_acquire))
        {
            TP_PANIC("[TP_LifeCycle] Module '{}' registered after initialize().", def.name);
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_modules.push_back(Module{std::move(def)});
    }

    void initialize(std::source_location loc);
    void finalize(std::source_location loc);
    bool is_initialized() const { return m_is_initialized.load(std::memory_order_acquire); }
    bool is_finalized() const { return m_is_finalized.load(std::memory_order_acquire); }

  private:
    std::vector<Module *> resolve_order();
    void stop_module(Module &mod, std::string &trace);
    std::string trace_header(const char *what, const std::source_location &loc) const;

    std::string m_app_name;
    uint64_t m_pid;
    std::mutex m_mutex;
    std::vector<Module> m_modules;
    std::vector<Module *> m_order;
    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};
};

std::string LifecycleManagerImpl::trace_header(const char *what,
                                               const std::source_location &loc) const
{
    return fmt::format("[TP_LifeCycle] [{}]:PID[{}] {} from {} ({}:{})\n", m_app_name, m_pid,
                       what, loc.function_name(),
                       testpipe::format_tools::filename_only(loc.file_name()), loc.line());
}

/**
 * @throws std::runtime_error on a duplicate name, an undefined dependency or a cycle.
 */
std::vector<LifecycleManagerImpl::Module *> LifecycleManagerImpl::resolve_order()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::map<std::string, Module *, std::less<>> by_name;
    for (auto &mod : m_modules)
    {
        if (!by_name.emplace(mod.def.name, &mod).second)
            throw std::runtime_error("Duplicate module name: " + mod.def.name);
    }
    for (const auto &mod : m_modules)
    {
        for (const auto &dep : mod.def.dependencies)
        {
            if (!by_name.contains(dep))
            {
                throw std::runtime_error(
                    fmt::format("Undefined dependency: {} (required by {})", dep, mod.def.name));
            }
        }
    }

    enum class Mark
    {
        Unvisited,
        OnPath,
        Placed
    };
    std::map<const Module *, Mark> marks;
    std::vector<std::string> path;
    std::vector<Module *> order;
    order.reserve(m_modules.size());

    std::function<void(Module *)> visit = [&](Module *mod)
    {
        Mark &mark = marks[mod];
        if (mark == Mark::Placed)
            return;
        if (mark == Mark::OnPath)
        {
            auto first = std::find(path.begin(), path.end(), mod->def.name);
            std::vector<std::string> cycle(first, path.end());
            cycle.push_back(mod->def.name);
            throw std::runtime_error(
                fmt::format("Circular dependency detected: {}", fmt::join(cycle, " -> ")));
        }
        mark = Mark::OnPath;
        path.push_back(mod->def.name);
        for (const auto &dep : mod->def.dependencies)
            visit(by_name.find(dep)->second);
        path.pop_back();
        marks[mod] = Mark::Placed;
        order.push_back(mod);
    };
    for (auto &mod : m_modules)
        visit(&mod);
    return order;
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
        return;

    std::string trace = trace_header("initialize()", loc);
    try
    {
        m_order = resolve_order();
    }
    catch (const std::runtime_error &)
    {
        m_is_initialized.store(false, std::memory_order_release);
        throw;
    }

    for (auto *mod : m_order)
    {
        trace += fmt::format("     -> starting '{}'", mod->def.name);
        try
        {
            if (mod->def.startup)
                mod->def.startup();
        }
        catch (const std::exception &e)
        {
            trace += " FAILED\n";
            for (auto it = m_order.rbegin(); it != m_order.rend(); ++it)
            {
                if ((*it)->started)
                    stop_module(**it, trace);
            }
            TP_DEBUG("{}", trace);
            m_is_finalized.store(true, std::memory_order_release);
            throw std::runtime_error(
                fmt::format("Module '{}' failed to start: {}", mod->def.name, e.what()));
        }
        mod->started = true;
        trace += "\n";
    }
    TP_DEBUG("{}", trace);
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string trace = trace_header("finalize()", loc);
    for (auto it = m_order.rbegin(); it != m_order.rend(); ++it)
    {
        if ((*it)->started)
            stop_module(**it, trace);
    }
    TP_DEBUG("{}", trace);
}

void LifecycleManagerImpl::stop_module(Module &mod, std::string &trace)
{
    const auto &shutdown = mod.def.shutdown;
    const StopOutcome outcome = run_shutdown(shutdown.func, shutdown.timeout);
    mod.started = false;
    switch (outcome.result)
    {
    case StopResult::Done:
        trace += fmt::format("     <- stopped '{}'\n", mod.def.name);
        break;
    case StopResult::TimedOut:
        trace += fmt::format("     <- '{}' did not stop within {}ms; thread detached\n",
                             mod.def.name, shutdown.timeout.count());
        break;
    case StopResult::Threw:
        trace += fmt::format("     <- '{}' threw on shutdown: {}\n", mod.def.name, outcome.error);
        break;
    }
}

// ============================================================================
// LifecycleManager public API (thin delegation layer)
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl != nullptr)
    {
        pImpl->registerModule(std::move(def.pImpl->def));
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
    return pImpl->is_initialized();
}

bool LifecycleManager::is_finalized()
{
    return pImpl->is_finalized();
}

} // namespace testpipe::utils
