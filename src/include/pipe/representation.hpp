#pragma once

/*******************************************************************************
 * @file representation.hpp
 * @brief Whitelisted snapshots of engine objects that can cross the pipe.
 *
 * One struct per source-object kind. Mandatory members are plain values; every
 * other member is an Attr<T> whose state says whether the engine object had the
 * attribute, lacked it, or had something the codec could not carry.
 ******************************************************************************/

#include "pipe/node_id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace testpipe::pipe
{

enum class AttrState
{
    Present,
    Absent,
    Unrepresentable,
};

template <typename T> class Attr
{
  public:
    Attr() = default;
    template <typename U = T>
        requires(std::is_constructible_v<T, U &&> && !std::is_same_v<std::decay_t<U>, Attr>)
    Attr(U &&value) : m_state(AttrState::Present), m_value(std::in_place, std::forward<U>(value))
    {
    }

    static Attr absent() { return Attr(); }
    static Attr unrepresentable()
    {
        Attr a;
        a.m_state = AttrState::Unrepresentable;
        return a;
    }

    AttrState state() const noexcept { return m_state; }
    bool present() const noexcept { return m_state == AttrState::Present; }
    explicit operator bool() const noexcept { return present(); }

    /// @throws std::bad_optional_access unless present().
    const T &value() const { return m_value.value(); }
    const T *get() const noexcept { return m_value ? &*m_value : nullptr; }
    T value_or(T fallback) const { return m_value ? *m_value : std::move(fallback); }

    bool operator==(const Attr &) const = default;

  private:
    AttrState m_state{AttrState::Absent};
    std::optional<T> m_value;
};

enum class NodeKind
{
    Node,
    Collector,
    Item,
    Module,
    Function,
    Package,
    Dir,
    Class,
};

enum class Phase
{
    Setup,
    Call,
    Teardown,
};

enum class ReportOutcome
{
    Passed,
    Failed,
    Skipped,
};

const char *to_string(NodeKind kind) noexcept;
const char *to_string(Phase phase) noexcept;
const char *to_string(ReportOutcome outcome) noexcept;
std::optional<NodeKind> node_kind_from_string(std::string_view name) noexcept;
std::optional<Phase> phase_from_string(std::string_view name) noexcept;
std::optional<ReportOutcome> outcome_from_string(std::string_view name) noexcept;

/// A captured output section of a report, e.g. ("Captured stdout call", "...").
struct Section
{
    std::string title;
    std::string body;

    bool operator==(const Section &) const = default;
};

struct ConfigRepr
{
    std::string name;
    std::string rootpath;
    nlohmann::json options = nlohmann::json::object(); ///< Whitelisted option values only.

    bool operator==(const ConfigRepr &) const = default;
};

struct SessionRepr
{
    Attr<ConfigRepr> config;
    int64_t testscollected{0};

    bool operator==(const SessionRepr &) const = default;
};

struct NodeRepr
{
    NodeKind kind{NodeKind::Node};
    std::string name;
    NodeID nodeid;
    Attr<std::string> path;
    Attr<std::string> originalname; ///< Functions only.

    /// Only function nodes are runnable tests.
    bool is_test() const noexcept { return kind == NodeKind::Function; }

    bool operator==(const NodeRepr &o) const
    {
        return kind == o.kind && name == o.name && nodeid == o.nodeid && path == o.path &&
               originalname == o.originalname;
    }
};

struct CollectReportRepr
{
    NodeID nodeid;
    ReportOutcome outcome{ReportOutcome::Passed};
    Attr<std::string> when;
    std::vector<NodeRepr> result;
    std::vector<Section> sections;
    /// Formatted failure traceback. Its presence marks the report as the primary one;
    /// duplicates from parallel collectors arrive without it.
    Attr<std::string> traceback;
    Attr<std::string> longrepr; ///< Never carried.

    bool operator==(const CollectReportRepr &) const = default;
};

struct Location
{
    std::string file;
    std::optional<int64_t> line;
    std::string domain;

    bool operator==(const Location &) const = default;
};

struct TestReportRepr
{
    NodeID nodeid;
    Phase when{Phase::Setup};
    ReportOutcome outcome{ReportOutcome::Passed};
    Attr<double> duration;
    Attr<double> start;
    Attr<double> stop;
    Attr<Location> location;
    std::vector<Section> sections;
    Attr<std::string> wasxfail; ///< Present (possibly empty) for expected-failure tests.
    Attr<std::string> worker_id;
    Attr<std::string> traceback;

    bool operator==(const TestReportRepr &) const = default;
};

struct WarningRepr
{
    std::string message;
    Attr<std::string> category;
    Attr<std::string> filename;
    Attr<int64_t> lineno;
    Attr<std::string> source;

    bool operator==(const WarningRepr &) const = default;
};

/// Stands in for an object the codec could not represent.
struct Unrepresentable
{
    std::string type_name;

    bool operator==(const Unrepresentable &) const = default;
};

using Representation = std::variant<ConfigRepr, SessionRepr, NodeRepr, CollectReportRepr,
                                    TestReportRepr, WarningRepr, Unrepresentable>;

template <typename T, typename Variant> struct is_variant_member;
template <typename T, typename... Ts>
struct is_variant_member<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)>
{
};

template <typename T>
inline constexpr bool is_representation_v = is_variant_member<T, Representation>::value;

} // namespace testpipe::pipe
