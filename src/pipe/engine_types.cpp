/*******************************************************************************
 * @file engine_types.cpp
 * @brief Conversion of engine objects into their pipe representations.
 ******************************************************************************/

#include "pipe/engine_types.hpp"

namespace testpipe::pipe::engine
{

namespace
{
Attr<std::string> slot_attr(const Slot &slot)
{
    if (const auto *s = std::get_if<std::string>(&slot))
        return *s;
    if (std::holds_alternative<Opaque>(slot))
        return Attr<std::string>::unrepresentable();
    return Attr<std::string>::absent();
}

template <typename T> Attr<T> optional_attr(const std::optional<T> &v)
{
    return v ? Attr<T>(*v) : Attr<T>::absent();
}
} // namespace

const std::vector<std::string> &option_whitelist()
{
    static const std::vector<std::string> names{"numprocesses", "verbose", "capture",
                                                "maxfail",      "keyword", "markexpr"};
    return names;
}

ConfigRepr represent(const Config &config)
{
    ConfigRepr r;
    r.name = config.name;
    r.rootpath = config.rootpath.string();
    if (config.options.is_object())
    {
        for (const auto &key : option_whitelist())
        {
            if (config.options.contains(key))
                r.options[key] = config.options.at(key);
        }
    }
    return r;
}

SessionRepr represent(const Session &session)
{
    SessionRepr r;
    if (session.config)
        r.config = represent(*session.config);
    r.testscollected = session.testscollected;
    return r;
}

NodeRepr represent(const Node &node)
{
    NodeRepr r;
    r.kind = node.kind;
    r.name = node.name;
    r.nodeid = NodeID(node.nodeid);
    if (node.path)
        r.path = node.path->string();
    if (node.kind == NodeKind::Function)
        r.originalname = optional_attr(node.originalname);
    return r;
}

CollectReportRepr represent(const CollectReport &report)
{
    CollectReportRepr r;
    r.nodeid = NodeID(report.nodeid);
    r.outcome = report.outcome;
    r.when = report.when;
    r.result.reserve(report.result.size());
    for (const auto &node : report.result)
        r.result.push_back(represent(node));
    r.sections = report.sections;
    r.traceback = optional_attr(report.traceback);
    return r;
}

TestReportRepr represent(const TestReport &report)
{
    TestReportRepr r;
    r.nodeid = NodeID(report.nodeid);
    r.when = report.when;
    r.outcome = report.outcome;
    r.duration = report.duration;
    r.start = report.start;
    r.stop = report.stop;
    r.location = report.location;
    r.sections = report.sections;
    r.wasxfail = optional_attr(report.wasxfail);
    r.worker_id = optional_attr(report.worker_id);
    r.traceback = optional_attr(report.traceback);
    return r;
}

WarningRepr represent(const WarningMessage &warning)
{
    WarningRepr r;
    r.message = warning.message;
    if (!warning.category.empty())
        r.category = warning.category;
    if (!warning.filename.empty())
        r.filename = warning.filename;
    r.lineno = optional_attr(warning.lineno);
    r.source = slot_attr(warning.source);
    return r;
}

} // namespace testpipe::pipe::engine
