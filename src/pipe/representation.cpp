/*******************************************************************************
 * @file representation.cpp
 * @brief Names of node kinds, phases and report outcomes, and their parsing.
 ******************************************************************************/

#include "pipe/representation.hpp"

#include <array>

namespace testpipe::pipe
{

namespace
{
constexpr std::array<std::pair<NodeKind, std::string_view>, 8> kNodeKindNames{{
    {NodeKind::Node, "Node"},
    {NodeKind::Collector, "Collector"},
    {NodeKind::Item, "Item"},
    {NodeKind::Module, "Module"},
    {NodeKind::Function, "Function"},
    {NodeKind::Package, "Package"},
    {NodeKind::Dir, "Dir"},
    {NodeKind::Class, "Class"},
}};
} // namespace

const char *to_string(NodeKind kind) noexcept
{
    for (const auto &[k, name] : kNodeKindNames)
    {
        if (k == kind)
            return name.data();
    }
    return "Node";
}

const char *to_string(Phase phase) noexcept
{
    switch (phase)
    {
    case Phase::Setup:
        return "setup";
    case Phase::Call:
        return "call";
    case Phase::Teardown:
        return "teardown";
    }
    return "setup";
}

const char *to_string(ReportOutcome outcome) noexcept
{
    switch (outcome)
    {
    case ReportOutcome::Passed:
        return "passed";
    case ReportOutcome::Failed:
        return "failed";
    case ReportOutcome::Skipped:
        return "skipped";
    }
    return "passed";
}

std::optional<NodeKind> node_kind_from_string(std::string_view name) noexcept
{
    for (const auto &[k, n] : kNodeKindNames)
    {
        if (n == name)
            return k;
    }
    return std::nullopt;
}

std::optional<Phase> phase_from_string(std::string_view name) noexcept
{
    if (name == "setup")
        return Phase::Setup;
    if (name == "call")
        return Phase::Call;
    if (name == "teardown")
        return Phase::Teardown;
    return std::nullopt;
}

std::optional<ReportOutcome> outcome_from_string(std::string_view name) noexcept
{
    if (name == "passed")
        return ReportOutcome::Passed;
    if (name == "failed")
        return ReportOutcome::Failed;
    if (name == "skipped")
        return ReportOutcome::Skipped;
    return std::nullopt;
}

} // namespace testpipe::pipe
