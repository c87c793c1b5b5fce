/*******************************************************************************
 * @file stream_reconstructor.cpp
 * @brief Read loop that turns engine output into lines.
 ******************************************************************************/

#include "pipe/stream_reconstructor.hpp"

#include "tp_service.hpp"

#include <cstring>
#include <vector>

namespace testpipe::pipe
{

StreamEnd StreamReconstructor::run(ByteSource &source, const LineCallback &on_line)
{
    using clock = std::chrono::steady_clock;

    LineAssembler assembler;
    std::vector<char> buf(m_opts.chunk_size > 0 ? m_opts.chunk_size : 1);
    StreamEnd end;
    bool terminated = false;
    bool clean_eof = false;
    std::optional<clock::time_point> silent_since_exit;

    auto deliver = [&](std::string_view chunk)
    {
        for (const auto &line : assembler.feed(chunk))
            on_line(line);
    };

    for (;;)
    {
        if (stop_requested() && !terminated)
        {
            source.terminate();
            terminated = true;
        }

        const ReadResult r = source.read_chunk(buf.data(), buf.size(), m_opts.poll);
        if (r.status == ReadResult::Status::Data)
        {
            silent_since_exit.reset();
            deliver(std::string_view(buf.data(), r.bytes));
            continue;
        }
        if (r.status == ReadResult::Status::EndOfStream)
        {
            clean_eof = true;
            break;
        }
        if (r.status == ReadResult::Status::Error)
        {
            LOGGER_ERROR("Read from engine failed: {}", std::strerror(r.error));
            // A live engine would keep wait() below blocked.
            if (!terminated)
            {
                source.terminate();
                terminated = true;
            }
            break;
        }

        // Nothing arrived within the poll interval.
        if (source.poll_exit())
        {
            const auto now = clock::now();
            if (!silent_since_exit)
                silent_since_exit = now;
            else if (now - *silent_since_exit >= m_opts.exit_grace)
            {
                LOGGER_WARN("Engine exited but its output stayed open for {} ms; closing",
                            m_opts.exit_grace.count());
                break;
            }
        }
    }

    if (auto last = assembler.finish())
        on_line(*last);

    end.exit_status = source.wait();
    end.abrupt = !clean_eof;
    LOGGER_DEBUG("Stream ended: exit status {}, abrupt={}", end.exit_status, end.abrupt);
    return end;
}

} // namespace testpipe::pipe
