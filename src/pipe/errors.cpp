/*******************************************************************************
 * @file errors.cpp
 * @brief Pipe error types and their recoverable logging.
 ******************************************************************************/

#include "pipe/errors.hpp"

#include "tp_service.hpp"

namespace testpipe::pipe
{

const char *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::Encoding:
        return "EncodingError";
    case ErrorKind::Decode:
        return "DecodeError";
    case ErrorKind::ProtocolViolation:
        return "ProtocolViolation";
    case ErrorKind::LifecycleOrder:
        return "LifecycleOrderError";
    case ErrorKind::ChildProcess:
        return "ChildProcessError";
    }
    return "PipeError";
}

const char *to_string(SpawnError err) noexcept
{
    switch (err)
    {
    case SpawnError::EmptyCommand:
        return "empty command";
    case SpawnError::PipeFailed:
        return "pipe creation failed";
    case SpawnError::ForkFailed:
        return "fork failed";
    case SpawnError::NotSupported:
        return "child processes are not supported on this platform";
    }
    return "unknown spawn error";
}

EncodingError::EncodingError(std::string type_name)
    : PipeError(ErrorKind::Encoding, fmt::format("Cannot represent {}", type_name)),
      m_type_name(std::move(type_name))
{
}

DecodeError::DecodeError(const std::string &reason, std::size_t offset, std::string before,
                         std::string after)
    : PipeError(ErrorKind::Decode, fmt::format("{} (at offset {})", reason, offset)),
      m_offset(offset), m_before(std::move(before)), m_after(std::move(after))
{
}

ProtocolViolation::ProtocolViolation(std::string message_name)
    : PipeError(ErrorKind::ProtocolViolation,
                fmt::format("Unknown message name '{}'", message_name)),
      m_message_name(std::move(message_name))
{
}

LifecycleOrderError::LifecycleOrderError(std::string node_id, const std::string &reason)
    : PipeError(ErrorKind::LifecycleOrder, fmt::format("{}: {}", reason, node_id)),
      m_node_id(std::move(node_id))
{
}

ChildProcessError::ChildProcessError(const std::string &reason, int exit_code, bool abrupt)
    : PipeError(ErrorKind::ChildProcess, reason), m_exit_code(exit_code), m_abrupt(abrupt)
{
}

void log_recoverable(const PipeError &err) noexcept
{
    if (err.kind() == ErrorKind::ChildProcess)
        LOGGER_ERROR("{}: {}", to_string(err.kind()), err.what());
    else
        LOGGER_WARN("{}: {}", to_string(err.kind()), err.what());
}

} // namespace testpipe::pipe
