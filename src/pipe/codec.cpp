/*******************************************************************************
 * @file codec.cpp
 * @brief Value encoding to msgpack hex text and back.
 ******************************************************************************/

#include "pipe/codec.hpp"

#include "tp_service.hpp"

#include <cstdint>
#include <limits>
#include <system_error>

namespace testpipe::pipe
{

using nlohmann::json;
namespace fs = std::filesystem;

namespace
{

constexpr const char *kKindKey = "$kind";
constexpr std::size_t kDiagnosticWrap = 60;

/// A well-formed document that does not describe a value we know.
class StructureError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// ── Encoding helpers ──────────────────────────────────────────────────────────

template <typename T, typename Conv>
void put_attr(json &j, const char *key, const Attr<T> &attr, Conv &&conv)
{
    switch (attr.state())
    {
    case AttrState::Present:
        j[key] = conv(attr.value());
        break;
    case AttrState::Unrepresentable:
        j[key] = nullptr;
        break;
    case AttrState::Absent:
        break;
    }
}

const auto identity = [](const auto &v) { return json(v); };

json sections_to_json(const std::vector<Section> &sections)
{
    json arr = json::array();
    for (const auto &s : sections)
        arr.push_back(json::array({s.title, s.body}));
    return arr;
}

json config_to_json(const ConfigRepr &r)
{
    return json{{kKindKey, "config"}, {"name", r.name}, {"rootpath", r.rootpath},
                {"options", r.options}};
}

json node_to_json(const NodeRepr &r)
{
    json j{{kKindKey, "node"}, {"type", to_string(r.kind)}, {"name", r.name},
           {"nodeid", r.nodeid.str()}};
    put_attr(j, "path", r.path, identity);
    put_attr(j, "originalname", r.originalname, identity);
    return j;
}

json repr_to_json(const Representation &repr)
{
    return std::visit(
        [](const auto &r) -> json
        {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, ConfigRepr>)
            {
                return config_to_json(r);
            }
            else if constexpr (std::is_same_v<T, SessionRepr>)
            {
                json j{{kKindKey, "session"}, {"testscollected", r.testscollected}};
                put_attr(j, "config", r.config, config_to_json);
                return j;
            }
            else if constexpr (std::is_same_v<T, NodeRepr>)
            {
                return node_to_json(r);
            }
            else if constexpr (std::is_same_v<T, CollectReportRepr>)
            {
                json j{{kKindKey, "collect_report"},
                       {"nodeid", r.nodeid.str()},
                       {"outcome", to_string(r.outcome)},
                       {"sections", sections_to_json(r.sections)}};
                json result = json::array();
                for (const auto &node : r.result)
                    result.push_back(node_to_json(node));
                j["result"] = std::move(result);
                put_attr(j, "when", r.when, identity);
                put_attr(j, "traceback", r.traceback, identity);
                put_attr(j, "longrepr", r.longrepr, identity);
                return j;
            }
            else if constexpr (std::is_same_v<T, TestReportRepr>)
            {
                json j{{kKindKey, "test_report"},
                       {"nodeid", r.nodeid.str()},
                       {"when", to_string(r.when)},
                       {"outcome", to_string(r.outcome)},
                       {"sections", sections_to_json(r.sections)}};
                put_attr(j, "duration", r.duration, identity);
                put_attr(j, "start", r.start, identity);
                put_attr(j, "stop", r.stop, identity);
                put_attr(j, "location", r.location,
                         [](const Location &loc)
                         {
                             return json::array({loc.file,
                                                 loc.line ? json(*loc.line) : json(nullptr),
                                                 loc.domain});
                         });
                put_attr(j, "wasxfail", r.wasxfail, identity);
                put_attr(j, "worker_id", r.worker_id, identity);
                put_attr(j, "traceback", r.traceback, identity);
                return j;
            }
            else if constexpr (std::is_same_v<T, WarningRepr>)
            {
                json j{{kKindKey, "warning"}, {"message", r.message}};
                put_attr(j, "category", r.category, identity);
                put_attr(j, "filename", r.filename, identity);
                put_attr(j, "lineno", r.lineno, identity);
                put_attr(j, "source", r.source, identity);
                return j;
            }
            else
            {
                return json{{kKindKey, "unrepresentable"}, {"type_name", r.type_name}};
            }
        },
        repr);
}

json value_to_json(const Value &value, bool lenient)
{
    return std::visit(
        [lenient](const auto &v) -> json
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
            {
                return nullptr;
            }
            else if constexpr (std::is_same_v<T, Value::Sequence>)
            {
                json arr = json::array();
                for (const auto &el : v)
                    arr.push_back(value_to_json(el, lenient));
                return arr;
            }
            else if constexpr (std::is_same_v<T, Representation>)
            {
                return repr_to_json(v);
            }
            else if constexpr (std::is_same_v<T, Opaque>)
            {
                if (!lenient)
                    throw EncodingError(v.type_name);
                return repr_to_json(Unrepresentable{v.type_name});
            }
            else
            {
                return json(v);
            }
        },
        value.storage());
}

// ── Decoding helpers ──────────────────────────────────────────────────────────

const json &require(const json &j, const char *key)
{
    if (!j.contains(key))
        throw StructureError(fmt::format("missing member '{}'", key));
    return j.at(key);
}

std::string get_string(const json &j, const char *key)
{
    const auto &v = require(j, key);
    if (!v.is_string())
        throw StructureError(fmt::format("member '{}' is not a string", key));
    return v.get<std::string>();
}

// msgpack uint64 values above INT64_MAX have no int64 form.
int64_t checked_int(const json &v, const char *what)
{
    if (v.is_number_unsigned() &&
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    {
        throw StructureError(
            fmt::format("{} {} does not fit a signed 64-bit integer", what, v.get<uint64_t>()));
    }
    return v.get<int64_t>();
}

int64_t get_int(const json &j, const char *key)
{
    const auto &v = require(j, key);
    if (!v.is_number_integer())
        throw StructureError(fmt::format("member '{}' is not an integer", key));
    return checked_int(v, key);
}

template <typename T, typename Conv> Attr<T> get_attr(const json &j, const char *key, Conv &&conv)
{
    if (!j.contains(key))
        return Attr<T>::absent();
    const auto &v = j.at(key);
    if (v.is_null())
        return Attr<T>::unrepresentable();
    return Attr<T>(conv(v, key));
}

std::string as_string(const json &v, const char *key)
{
    if (!v.is_string())
        throw StructureError(fmt::format("member '{}' is not a string", key));
    return v.get<std::string>();
}

double as_double(const json &v, const char *key)
{
    if (!v.is_number())
        throw StructureError(fmt::format("member '{}' is not a number", key));
    return v.get<double>();
}

int64_t as_int(const json &v, const char *key)
{
    if (!v.is_number_integer())
        throw StructureError(fmt::format("member '{}' is not an integer", key));
    return checked_int(v, key);
}

std::vector<Section> sections_from_json(const json &j)
{
    std::vector<Section> out;
    if (!j.contains("sections"))
        return out;
    const auto &arr = j.at("sections");
    if (!arr.is_array())
        throw StructureError("member 'sections' is not an array");
    for (const auto &el : arr)
    {
        if (!el.is_array() || el.size() != 2 || !el[0].is_string() || !el[1].is_string())
            throw StructureError("malformed section entry");
        out.push_back(Section{el[0].get<std::string>(), el[1].get<std::string>()});
    }
    return out;
}

template <typename E>
E enum_member(const json &j, const char *key, std::optional<E> (*parse)(std::string_view) noexcept)
{
    const std::string s = get_string(j, key);
    if (auto e = parse(s))
        return *e;
    throw StructureError(fmt::format("member '{}' has unknown value '{}'", key, s));
}

void log_halves(std::string_view reason, std::string_view before, std::string_view after)
{
    LOGGER_WARN("Codec: {} encoded data received:", reason);
    LOGGER_WARN("  Before::");
    for (const auto &chunk : format_tools::wrap_text(before, kDiagnosticWrap))
        LOGGER_WARN("    {}", chunk);
    LOGGER_WARN("  After::");
    for (const auto &chunk : format_tools::wrap_text(after, kDiagnosticWrap))
        LOGGER_WARN("    {}", chunk);
}

} // anonymous namespace

// ── Codec ─────────────────────────────────────────────────────────────────────

Codec::Codec()
{
    std::error_code ec;
    m_rootpath = fs::current_path(ec);
}

Codec::Codec(fs::path rootpath) : m_rootpath(std::move(rootpath)) {}

json Codec::to_json(const Value &value)
{
    return value_to_json(value, false);
}

json Codec::to_json_lenient(const Value &value)
{
    return value_to_json(value, true);
}

std::string Codec::encode(const Value &value) const
{
    json j;
    try
    {
        j = to_json(value);
    }
    catch (const EncodingError &e)
    {
        log_recoverable(e);
        j = to_json_lenient(value);
    }
    const std::vector<std::uint8_t> packed = json::to_msgpack(j);
    return format_tools::to_hex(
        std::string_view(reinterpret_cast<const char *>(packed.data()), packed.size()));
}

Value Codec::decode(std::string_view text)
{
    auto bytes = format_tools::from_hex(text);
    if (bytes.is_error())
    {
        const auto offset = std::min<std::size_t>(static_cast<std::size_t>(bytes.error_code()),
                                                  text.size());
        std::string before(text.substr(0, offset));
        std::string after(text.substr(offset));
        log_halves(format_tools::to_string(bytes.error()), before, after);
        throw DecodeError(fmt::format("Non-hex payload: {}", format_tools::to_string(bytes.error())),
                          offset, std::move(before), std::move(after));
    }

    json j;
    try
    {
        j = json::from_msgpack(bytes.content());
    }
    catch (const json::parse_error &e)
    {
        const std::size_t byte_index = e.byte > 0 ? e.byte - 1 : 0;
        const std::size_t offset = std::min(2 * byte_index, text.size());
        std::string before(text.substr(0, offset));
        std::string after(text.substr(offset));
        log_halves("Undecodable", before, after);
        throw DecodeError(fmt::format("Bad payload: {}", e.what()), offset, std::move(before),
                          std::move(after));
    }

    try
    {
        return value_from_json(j);
    }
    catch (const StructureError &e)
    {
        throw DecodeError(fmt::format("Malformed payload: {}", e.what()), 0, std::string(),
                          std::string(text));
    }
}

Value Codec::from_json(const json &j)
{
    try
    {
        return value_from_json(j);
    }
    catch (const StructureError &e)
    {
        throw DecodeError(fmt::format("Malformed payload: {}", e.what()), 0, std::string(),
                          std::string());
    }
}

Value Codec::value_from_json(const json &j)
{
    switch (j.type())
    {
    case json::value_t::null:
        return Value();
    case json::value_t::boolean:
        return Value(j.get<bool>());
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
        return Value(checked_int(j, "integer"));
    case json::value_t::number_float:
        return Value(j.get<double>());
    case json::value_t::string:
        return Value(j.get<std::string>());
    case json::value_t::array:
    {
        Value::Sequence seq;
        seq.reserve(j.size());
        for (const auto &el : j)
            seq.push_back(value_from_json(el));
        return Value(std::move(seq));
    }
    case json::value_t::object:
        break;
    default:
        throw StructureError(fmt::format("unsupported JSON type '{}'", j.type_name()));
    }

    const std::string kind = get_string(j, kKindKey);
    if (kind == "config")
    {
        ConfigRepr r;
        r.name = get_string(j, "name");
        r.rootpath = get_string(j, "rootpath");
        if (j.contains("options"))
            r.options = j.at("options");
        if (!m_rootpath_captured)
        {
            if (!r.rootpath.empty())
                m_rootpath = r.rootpath;
            m_rootpath_captured = true;
            LOGGER_DEBUG("Codec: root path is '{}'", m_rootpath.string());
        }
        return Value(std::move(r));
    }
    if (kind == "session")
    {
        SessionRepr r;
        r.testscollected = get_int(j, "testscollected");
        r.config = get_attr<ConfigRepr>(j, "config",
                                        [this](const json &v, const char *key)
                                        {
                                            const Value cfg = value_from_json(v);
                                            if (const auto *c = cfg.as<ConfigRepr>())
                                                return *c;
                                            throw StructureError(fmt::format(
                                                "member '{}' is not a config", key));
                                        });
        return Value(std::move(r));
    }
    if (kind == "node")
    {
        NodeRepr r;
        r.kind = enum_member(j, "type", &node_kind_from_string);
        r.name = get_string(j, "name");
        r.nodeid = make_node_id(get_string(j, "nodeid"));
        r.path = get_attr<std::string>(j, "path", as_string);
        r.originalname = get_attr<std::string>(j, "originalname", as_string);
        return Value(std::move(r));
    }
    if (kind == "collect_report")
    {
        CollectReportRepr r;
        r.nodeid = make_node_id(get_string(j, "nodeid"));
        r.outcome = enum_member(j, "outcome", &outcome_from_string);
        r.when = get_attr<std::string>(j, "when", as_string);
        const auto &result = require(j, "result");
        if (!result.is_array())
            throw StructureError("member 'result' is not an array");
        for (const auto &el : result)
        {
            Value node = value_from_json(el);
            const auto *n = node.as<NodeRepr>();
            if (!n)
                throw StructureError("collect report result holds a non-node value");
            r.result.push_back(*n);
        }
        r.sections = sections_from_json(j);
        r.traceback = get_attr<std::string>(j, "traceback", as_string);
        r.longrepr = get_attr<std::string>(j, "longrepr", as_string);
        return Value(std::move(r));
    }
    if (kind == "test_report")
    {
        TestReportRepr r;
        r.nodeid = make_node_id(get_string(j, "nodeid"));
        r.when = enum_member(j, "when", &phase_from_string);
        r.outcome = enum_member(j, "outcome", &outcome_from_string);
        r.duration = get_attr<double>(j, "duration", as_double);
        r.start = get_attr<double>(j, "start", as_double);
        r.stop = get_attr<double>(j, "stop", as_double);
        r.location = get_attr<Location>(
            j, "location",
            [](const json &v, const char *key)
            {
                if (!v.is_array() || v.size() != 3 || !v[0].is_string() ||
                    !v[2].is_string() || !(v[1].is_null() || v[1].is_number_integer()))
                    throw StructureError(fmt::format("member '{}' is malformed", key));
                Location loc{v[0].get<std::string>(), std::nullopt,
                             v[2].get<std::string>()};
                if (!v[1].is_null())
                    loc.line = v[1].get<int64_t>();
                return loc;
            });
        r.sections = sections_from_json(j);
        r.wasxfail = get_attr<std::string>(j, "wasxfail", as_string);
        r.worker_id = get_attr<std::string>(j, "worker_id", as_string);
        r.traceback = get_attr<std::string>(j, "traceback", as_string);
        return Value(std::move(r));
    }
    if (kind == "warning")
    {
        WarningRepr r;
        r.message = get_string(j, "message");
        r.category = get_attr<std::string>(j, "category", as_string);
        r.filename = get_attr<std::string>(j, "filename", as_string);
        r.lineno = get_attr<int64_t>(j, "lineno", as_int);
        r.source = get_attr<std::string>(j, "source", as_string);
        return Value(std::move(r));
    }
    if (kind == "unrepresentable")
    {
        return Value(Unrepresentable{get_string(j, "type_name")});
    }
    throw StructureError(fmt::format("unknown representation kind '{}'", kind));
}

} // namespace testpipe::pipe
