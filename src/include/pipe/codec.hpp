#pragma once

/*******************************************************************************
 * @file codec.hpp
 * @brief Value <-> transport text.
 *
 * Encoding: Representation → tagged JSON object (`"$kind"`), sequences recurse,
 * primitives unchanged; the JSON is packed as MessagePack and written as
 * lowercase hex so a frame argument is a single whitespace-free token.
 *
 * Attribute states map to JSON as: Present → the value, Absent → key omitted,
 * Unrepresentable → null.
 ******************************************************************************/

#include "pipe/errors.hpp"
#include "pipe/value.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace testpipe::pipe
{

class Codec
{
  public:
    /// The root path starts as the current directory until a config is decoded.
    Codec();
    explicit Codec(std::filesystem::path rootpath);

    /**
     * @brief Encodes a value; never throws for an accepted value.
     * @details Opaque members raise an EncodingError internally, which is logged
     *          and replaced by an Unrepresentable placeholder.
     */
    std::string encode(const Value &value) const;

    /**
     * @brief Decodes one frame argument.
     * @throws DecodeError on bad hex, bad MessagePack, or an unknown or malformed
     *         representation.
     */
    Value decode(std::string_view text);

    /// Strict conversion; @throws EncodingError for an Opaque anywhere in @p value.
    static nlohmann::json to_json(const Value &value);
    /// Like to_json() but substitutes placeholders for Opaque values.
    static nlohmann::json to_json_lenient(const Value &value);
    /// @throws DecodeError (offset 0) on a structurally invalid document.
    Value from_json(const nlohmann::json &j);

    const std::filesystem::path &rootpath() const noexcept { return m_rootpath; }
    bool rootpath_captured() const noexcept { return m_rootpath_captured; }

    /// Rehydrates a node id string with the current root path.
    NodeID make_node_id(std::string value) const { return NodeID(std::move(value), m_rootpath); }

  private:
    Value value_from_json(const nlohmann::json &j);

    std::filesystem::path m_rootpath;
    bool m_rootpath_captured{false};
};

} // namespace testpipe::pipe
