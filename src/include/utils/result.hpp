/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions
 *
 * Every engine stage reports expected failures (bad offsets, overlapping
 * images, malformed headers) through this type instead of throwing.
 *
 * Design Philosophy:
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] prevents ignoring errors
 */

#pragma once

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace aiomerge::utils
{

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type
 * @tparam E Error type. Either a plain enum or a small struct carrying the
 *           failure context (see engine::MergeFailure).
 *
 * Usage:
 * @code
 * Result<LayoutPlan, MergeFailure> plan = plan_layout(entries);
 * if (plan.is_ok()) {
 *     const LayoutPlan &p = plan.content();
 *     // use p
 * } else {
 *     LOGGER_WARN("{}", plan.error().message);
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
    static_assert(!std::is_same_v<T, E>, "Result<T, E> requires distinct value and error types");

  public:
    using value_type = T;
    using error_type = E;

    // ====================================================================
    // Construction - Use static factory methods for clarity
    // ====================================================================

    /**
     * @brief Create a successful Result containing a value
     * @param value The success value (moved into Result)
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error value (moved into Result)
     */
    [[nodiscard]] static Result error(E err)
    {
        Result result;
        result.m_data = ErrorData{std::move(err)};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}}) {}

    // Movable but not copyable (output images can be large)
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Get the success content (const reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     *
     * After this call, Result is left in a valid but unspecified state.
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    /**
     * @brief Get the success value or a default if error
     */
    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /**
     * @brief Get the error value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] const E &error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_value;
    }

  private:
    struct ErrorData
    {
        E error_value;
    };

    std::variant<T, ErrorData> m_data;
};

} // namespace aiomerge::utils
