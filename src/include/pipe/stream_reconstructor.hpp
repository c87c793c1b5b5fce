#pragma once

/*******************************************************************************
 * @file stream_reconstructor.hpp
 * @brief Pumps a ByteSource into complete lines.
 ******************************************************************************/

#include "pipe/child_process.hpp"
#include "pipe/line_assembler.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace testpipe::pipe
{

struct StreamEnd
{
    int exit_status{-1};
    bool abrupt{false}; ///< The stream did not end with a clean end-of-file.
};

/**
 * @class StreamReconstructor
 * @brief Reads a source until it closes and hands every line over in arrival order.
 *
 * The read loop is bounded by the producer's lifetime: once the producer has
 * exited, a stream that stays silent for `exit_grace` is treated as closed. This
 * covers grandchildren that inherited the write end and keep it open.
 */
class StreamReconstructor
{
  public:
    using LineCallback = std::function<void(const std::string &)>;

    struct Options
    {
        std::size_t chunk_size{1024};
        std::chrono::milliseconds poll{100};
        std::chrono::milliseconds exit_grace{500};
    };

    StreamReconstructor() = default;
    explicit StreamReconstructor(Options opts) : m_opts(opts) {}

    /**
     * @brief Runs until end of stream and reaps the producer.
     * @details A final unterminated line is delivered before returning.
     */
    StreamEnd run(ByteSource &source, const LineCallback &on_line);

    /// Thread-safe; the running loop terminates the source and drains what is left.
    void request_stop() noexcept { m_stop_requested.store(true, std::memory_order_release); }

    bool stop_requested() const noexcept
    {
        return m_stop_requested.load(std::memory_order_acquire);
    }

  private:
    Options m_opts;
    std::atomic<bool> m_stop_requested{false};
};

} // namespace testpipe::pipe
