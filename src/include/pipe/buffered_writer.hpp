#pragma once

/*******************************************************************************
 * @file buffered_writer.hpp
 * @brief Joins output fragments into whole lines.
 ******************************************************************************/

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace testpipe::pipe
{

/// Fragments from copy_stdout / copy_stderr frames arrive split anywhere; the
/// writer emits complete lines (without the newline) and keeps the rest.
class BufferedWriter
{
  public:
    using LineFn = std::function<void(const std::string &)>;

    BufferedWriter() = default;
    explicit BufferedWriter(LineFn emit) : m_emit(std::move(emit)) {}

    void set_sink(LineFn emit) { m_emit = std::move(emit); }

    void append(std::string_view text)
    {
        m_partial.append(text);
        std::size_t start = 0;
        for (auto nl = m_partial.find('\n'); nl != std::string::npos;
             nl = m_partial.find('\n', start))
        {
            if (m_emit)
                m_emit(m_partial.substr(start, nl - start));
            start = nl + 1;
        }
        m_partial.erase(0, start);
    }

    /// Emits an unterminated remainder, if any.
    void flush_partial()
    {
        if (m_partial.empty())
            return;
        std::string rest;
        rest.swap(m_partial);
        if (m_emit)
            m_emit(rest);
    }

    bool has_partial() const noexcept { return !m_partial.empty(); }

  private:
    LineFn m_emit;
    std::string m_partial;
};

} // namespace testpipe::pipe
