#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include "utils/debug_info.hpp"

namespace bmapcopy::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * The cleanup action runs when the current scope is exited, whether by normal
 * execution or by an exception. It is movable but not copyable, enforcing unique
 * ownership of the cleanup action.
 *
 * @code
 *  int fd = ::open(path, O_RDONLY);
 *  auto guard = bmapcopy::basics::make_scope_guard([&]() { ::close(fd); });
 *  read_header(fd); // may throw; fd is still closed
 * @endcode
 *
 * ### Error Handling
 *
 * The destructor is `noexcept`. A `std::exception` thrown by the callable during
 * the destructor is reported through BMC_DEBUG and dropped. Use `invoke_and_rethrow()`
 * when the caller must observe a failing cleanup (for example, restoring device
 * settings whose failure is fatal).
 *
 * ### Thread Safety
 *
 * Not thread-safe. A single guard must not be touched from multiple threads.
 */
// `std::invocable<Callable&>` because the guard invokes its stored member as an lvalue.
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

    /**
     * @brief Checks if the guard is active and will execute on scope exit.
     */
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /**
     * @brief Move constructor. The source guard is dismissed and will no longer execute.
     */
    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            try
            {
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                BMC_DEBUG("ScopeGuard callable threw during scope exit: {}", e.what());
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /**
     * @brief Deactivates the guard, preventing the callable from being executed.
     */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Executes the callable immediately if active, and then dismisses the guard.
     *
     * A `std::exception` thrown by the callable is reported and dropped.
     */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // Must dismiss before invoke to prevent double execution.
            try
            {
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                BMC_DEBUG("ScopeGuard callable threw on invoke(): {}", e.what());
            }
        }
    }

    /**
     * @brief Executes the callable immediately if active, and then dismisses the guard.
     *
     * This version does NOT swallow exceptions. The guard is still dismissed before
     * execution.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief A factory function to create a ScopeGuard.
 *
 * @note The callable `f` is always stored by value. Ensure that any references
 *       captured by `f` remain valid until the guard executes.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace bmapcopy::basics
