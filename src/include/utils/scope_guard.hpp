#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace aiomerge::basics
{

/**
 * @class ScopeGuard
 * @brief RAII guard that runs a cleanup action when the scope is left.
 *
 * Used by the output writer to remove its temporary file on every failure
 * path; the success path calls dismiss() once the rename has happened.
 *
 * @code
 *  auto cleanup = aiomerge::basics::make_scope_guard([&]() noexcept {
 *      std::error_code ec;
 *      std::filesystem::remove(tmp_path, ec);
 *  });
 *  write_everything(tmp_path);
 *  std::filesystem::rename(tmp_path, target);
 *  cleanup.dismiss();
 * @endcode
 *
 * The callable runs inside a noexcept destructor, so it must itself be
 * noexcept. This is checked at compile time.
 *
 * @tparam Callable Decayed, non-reference callable type taking no arguments.
 */
template <typename Callable>
    requires std::invocable<Callable &>
class ScopeGuard
{
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard stores its callable by value.");
    static_assert(std::is_nothrow_invocable_v<Callable &>,
                  "ScopeGuard's callable must be noexcept; it runs from a destructor.");

  public:
    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
            std::invoke(m_func);
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /** @brief True while the guard will still run its action. */
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /** @brief Deactivates the guard; the action will not run. */
    constexpr void dismiss() noexcept { m_active = false; }

    /** @brief Runs the action now (at most once) and deactivates the guard. */
    void invoke() noexcept
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
 * @brief Factory for ScopeGuard; the callable is stored by value.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace aiomerge::basics
