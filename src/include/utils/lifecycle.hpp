#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Manages application startup and shutdown with dependency-aware modules.
 *
 * **Design**
 *
 * 1.  **Dependency Management**: Modules declare their dependencies by name, and the
 *     `LifecycleManager` performs a topological sort to determine the initialization
 *     sequence. Cyclical or missing dependencies are a fatal error.
 *
 * 2.  **Pimpl**: Both `LifecycleManager` and `ModuleDef` hide their STL containers
 *     behind a private implementation so the exported ABI stays stable.
 *
 * 3.  **Singleton**: The `LifecycleManager` is a process-wide singleton.
 *
 * 4.  **Graceful Shutdown**: Shutdown runs in reverse start order with a per-module
 *     timeout, so a hanging module cannot block process exit indefinitely.
 *
 * **Usage**
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     bmapcopy::utils::LifecycleGuard app_lifecycle(bmapcopy::utils::MakeModDefList(
 *         bmapcopy::utils::Logger::GetLifecycleModule(),
 *         bmapcopy::crypto::GetLifecycleModule()));
 *
 *     LOGGER_INFO("Application started successfully.");
 *     // ... main application logic ...
 *     return 0;
 * } // FinalizeApp() runs here.
 * ```
 ******************************************************************************/
#include "bmc_base.hpp"

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace bmapcopy::utils
{

class LifecycleManagerImpl;

/// @brief Helper factory: constructs a vector<ModuleDef> by moving the supplied ModuleDef args.
// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class LifecycleManager
 * @brief The singleton manager for the application lifecycle.
 */
class BMAPCOPY_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module with the lifecycle system.
     *
     * All modules must be registered *before* `initialize()`. Registration after
     * initialization has begun is a fatal error.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module in dependency order. Idempotent.
     *
     * Aborts the application on a dependency cycle, an unknown dependency, or a
     * startup callback that throws.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Shuts modules down in reverse start order. Idempotent.
     */
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    /**
     * @brief Returns true if the named module has been started and not yet shut down.
     */
    [[nodiscard]] bool is_module_started(std::string_view name);

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    ::bmapcopy::utils::LifecycleManager::instance().register_module(std::move(module_def));
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
 * The first guard constructed in a process registers its modules and initializes the
 * application; its destructor finalizes it. Later guards are no-ops.
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

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    // Usage: LifecycleGuard guard(MakeModDefList(ModuleDef("Mod1"), ModuleDef("Mod2")));
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
            BMC_DEBUG("[BMC_LifeCycle] LifecycleGuard is being destructed as owner. "
                      "Constructor was located in function {}. ({}:{}) ",
                      m_loc.function_name(),
                      bmapcopy::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            bmapcopy::utils::FinalizeApp(m_loc);
        }
    }

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
                bmapcopy::utils::RegisterModule(std::move(m));
            }
            bmapcopy::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            BMC_DEBUG("[BMC_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an "
                      "owner already exists; provided modules were ignored. ({}:{})",
                      bmapcopy::platform::get_executable_name(), bmapcopy::platform::get_pid(),
                      bmapcopy::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    bool m_is_owner{false};
};

} // namespace bmapcopy::utils
