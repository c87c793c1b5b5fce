/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * Used where a failure is part of normal operation and the caller is expected to
 * branch on it (spawning the engine process, decoding hex text). Exceptional
 * conditions still use exceptions.
 *
 * - Distinguishes between success (T) and expected failures (E)
 * - No implicit conversions to bool
 * - [[nodiscard]] prevents ignoring errors
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace testpipe::utils
{

/**
 * @class Result
 * @brief Holds either a success value or an error enum plus a detail code.
 *
 * @tparam T Success value type
 * @tparam E Error enum type
 *
 * Usage:
 * @code
 * auto child = ChildProcess::spawn(argv);
 * if (child.is_error()) {
 *     LOGGER_ERROR("spawn failed: {} (errno {})", to_string(child.error()), child.error_code());
 *     return;
 * }
 * ChildProcess proc = std::move(child).content();
 * @endcode
 *
 * Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result.
     * @param err The error enum value
     * @param code Detail code, e.g. an errno or a character offset (default 0)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code};
        return result;
    }

    // Starts in error state with a default error.
    Result() : m_data(ErrorData{E{}, 0}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Access the success content.
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

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Move the success content out of the Result.
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @brief Get the error enum value.
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    /**
     * @brief Get the detail code recorded with the error (0 if not set).
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

} // namespace testpipe::utils
