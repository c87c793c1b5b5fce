#pragma once

/*******************************************************************************
 * @file engine_types.hpp
 * @brief The objects a test engine hands to its reporting hooks.
 *
 * These carry more than the pipe transmits (plugin lists, keywords, raw long
 * representations). represent() copies the whitelisted members into the matching
 * Representation and nothing else.
 ******************************************************************************/

#include "pipe/representation.hpp"
#include "pipe/value.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace testpipe::pipe::engine
{

/// An attribute slot that may hold text, nothing, or an arbitrary engine object.
using Slot = std::variant<std::monostate, std::string, Opaque>;

struct Config
{
    std::string name{"config"};
    std::filesystem::path rootpath;
    nlohmann::json options = nlohmann::json::object();
    std::vector<std::string> plugins;
    std::filesystem::path invocation_dir;
};

struct Session
{
    std::shared_ptr<const Config> config;
    int64_t testscollected{0};
    std::vector<std::string> items;
};

struct Node
{
    NodeKind kind{NodeKind::Function};
    std::string name;
    std::string nodeid;
    std::optional<std::filesystem::path> path;
    std::optional<std::string> originalname;
    std::string callobj;
    std::vector<std::string> keywords;
};

struct CollectReport
{
    std::string nodeid;
    ReportOutcome outcome{ReportOutcome::Passed};
    std::string when{"collect"};
    std::vector<Node> result;
    std::vector<Section> sections;
    /// Only the collector that produced the report fills this in.
    std::optional<std::string> traceback;
    std::string longrepr;
};

struct TestReport
{
    std::string nodeid;
    Phase when{Phase::Setup};
    ReportOutcome outcome{ReportOutcome::Passed};
    double duration{0.0};
    double start{0.0};
    double stop{0.0};
    Location location;
    std::vector<Section> sections;
    std::optional<std::string> wasxfail;
    std::optional<std::string> worker_id;
    std::optional<std::string> traceback;
    std::map<std::string, int> keywords;
    std::string longrepr;
    std::vector<std::pair<std::string, std::string>> user_properties;
};

struct WarningMessage
{
    std::string message;
    std::string category;
    std::string filename;
    std::optional<int64_t> lineno;
    Slot source;
};

/// Option names copied into ConfigRepr::options.
const std::vector<std::string> &option_whitelist();

ConfigRepr represent(const Config &config);
SessionRepr represent(const Session &session);
NodeRepr represent(const Node &node);
CollectReportRepr represent(const CollectReport &report);
TestReportRepr represent(const TestReport &report);
WarningRepr represent(const WarningMessage &warning);

} // namespace testpipe::pipe::engine
