#pragma once

/*******************************************************************************
 * @file errors.hpp
 * @brief Error taxonomy of the reporting pipe.
 *
 * Every error is recoverable: the producer degrades unrepresentable values to
 * placeholders, the consumer skips malformed frames, and a child that dies is
 * reported rather than rethrown into the caller's run loop. All kinds derive from
 * PipeError so a single catch site can log them with log_recoverable().
 ******************************************************************************/

#include <cstddef>
#include <stdexcept>
#include <string>

namespace testpipe::pipe
{

enum class ErrorKind
{
    Encoding,
    Decode,
    ProtocolViolation,
    LifecycleOrder,
    ChildProcess,
};

const char *to_string(ErrorKind kind) noexcept;

class PipeError : public std::runtime_error
{
  public:
    PipeError(ErrorKind kind, const std::string &what_arg)
        : std::runtime_error(what_arg), m_kind(kind)
    {
    }

    ErrorKind kind() const noexcept { return m_kind; }

  private:
    ErrorKind m_kind;
};

/// A value (or a member of it) has no registered wire representation.
class EncodingError : public PipeError
{
  public:
    explicit EncodingError(std::string type_name);

    const std::string &type_name() const noexcept { return m_type_name; }

  private:
    std::string m_type_name;
};

/**
 * @brief A frame argument could not be turned back into a value.
 * @details `offset()` is a position in the hex text; `before()` and `after()` are
 *          the text on either side of it, which is what is needed to spot two
 *          writers interleaving on the same channel.
 */
class DecodeError : public PipeError
{
  public:
    DecodeError(const std::string &reason, std::size_t offset, std::string before,
                std::string after);

    std::size_t offset() const noexcept { return m_offset; }
    const std::string &before() const noexcept { return m_before; }
    const std::string &after() const noexcept { return m_after; }

  private:
    std::size_t m_offset;
    std::string m_before;
    std::string m_after;
};

/// A frame carried a message name this build does not know.
class ProtocolViolation : public PipeError
{
  public:
    explicit ProtocolViolation(std::string message_name);

    const std::string &message_name() const noexcept { return m_message_name; }

  private:
    std::string m_message_name;
};

/// A per-test event referred to an unknown test, or repeated a phase.
class LifecycleOrderError : public PipeError
{
  public:
    LifecycleOrderError(std::string node_id, const std::string &reason);

    const std::string &node_id() const noexcept { return m_node_id; }

  private:
    std::string m_node_id;
};

/// The engine process exited with a non-zero status or its stream closed abruptly.
class ChildProcessError : public PipeError
{
  public:
    ChildProcessError(const std::string &reason, int exit_code, bool abrupt);

    int exit_code() const noexcept { return m_exit_code; }
    bool abrupt() const noexcept { return m_abrupt; }

  private:
    int m_exit_code;
    bool m_abrupt;
};

/// Expected failures of ChildProcess::spawn, returned through utils::Result.
enum class SpawnError
{
    EmptyCommand,
    PipeFailed,
    ForkFailed,
    NotSupported,
};

const char *to_string(SpawnError err) noexcept;

/**
 * @brief Logs an error with its kind; WARN level, ERROR for ChildProcessError.
 */
void log_recoverable(const PipeError &err) noexcept;

} // namespace testpipe::pipe
