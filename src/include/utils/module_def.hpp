#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "bmapcopy_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace bmapcopy::utils
{

class ModuleDefImpl;
class LifecycleManager; // Forward-declaration for the friend class

/**
 * @brief A function pointer type for module startup and shutdown callbacks.
 *
 * Function pointers cross shared-library boundaries and must use C-compatible
 * signatures. The `arg` pointer is `nullptr` when no argument was supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief An ABI-safe builder for a lifecycle module definition.
 *
 * `ModuleDef` uses the Pimpl idiom to hide its internal `std::string` and
 * `std::vector` members. It is movable but not copyable; once registered with the
 * `LifecycleManager`, ownership is transferred.
 */
class BMAPCOPY_UTILS_EXPORT ModuleDef
{
  public:
    /// Maximum number of characters allowed in a module or dependency name.
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /**
     * @brief Constructs a module definition with a given name.
     * @param name Unique name for this module (e.g. `"bmapcopy::utils::Logger"`).
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
     * @brief Declares a dependency on another module.
     *
     * The named module is started before this one and shut down after it.
     * An empty `dependency_name` is ignored.
     * @throws std::length_error if `dependency_name.size() > MAX_MODULE_NAME_LEN`.
     */
    void add_dependency(std::string_view dependency_name);

    /**
     * @brief Sets the startup callback.
     * @param startup_func Called on module startup; must not be null.
     */
    void set_startup(LifecycleCallback startup_func);

    /**
     * @brief Sets the shutdown callback.
     * @param shutdown_func Called on module shutdown; must not be null.
     * @param timeout       Maximum time allowed for the callback to complete.
     *                      Use `std::chrono::milliseconds(0)` to wait without limit.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

    /** @brief The module name given at construction. */
    [[nodiscard]] std::string_view name() const noexcept;

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace bmapcopy::utils
