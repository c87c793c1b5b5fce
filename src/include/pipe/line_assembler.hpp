#pragma once

/*******************************************************************************
 * @file line_assembler.hpp
 * @brief Reassembles newline-terminated lines from arbitrary byte chunks.
 ******************************************************************************/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace testpipe::pipe
{

class LineAssembler
{
  public:
    /**
     * @brief Adds a chunk and returns the lines it completed, in order.
     * @details A trailing partial line is kept and prefixed to the next chunk.
     *          Returned lines have trailing whitespace (including '\r') removed.
     */
    std::vector<std::string> feed(std::string_view chunk);

    /// The unterminated remainder, if any; the assembler is empty afterwards.
    std::optional<std::string> finish();

    std::size_t pending_size() const noexcept { return m_partial.size(); }

  private:
    std::string m_partial;
};

} // namespace testpipe::pipe
