/**
 * @file run_config.cpp
 * @brief Layered RunConfig loading.
 */
#include "tp_service.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace testpipe::utils
{

namespace fs = std::filesystem;

namespace
{

constexpr const char *kDefaultFileName = "testpipe.default.json";
constexpr const char *kUserFileName = "testpipe.user.json";

/// Reads and parses a JSON file. Unreadable or malformed files throw.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw std::runtime_error(fmt::format("Cannot open config file '{}'", path.string()));
    }
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(
            fmt::format("Malformed JSON in config file '{}': {}", path.string(), e.what()));
    }
}

[[noreturn]] void type_error(const std::string &origin, const char *section, const char *key,
                             const char *expected)
{
    throw std::runtime_error(fmt::format("Config '{}': '{}.{}' must be {}", origin, section,
                                         key, expected));
}

std::vector<std::string> get_string_list(const nlohmann::json &sec, const std::string &origin,
                                         const char *section, const char *key)
{
    const auto &v = sec.at(key);
    if (!v.is_array())
        type_error(origin, section, key, "an array of strings");
    std::vector<std::string> out;
    out.reserve(v.size());
    for (const auto &el : v)
    {
        if (!el.is_string())
            type_error(origin, section, key, "an array of strings");
        out.push_back(el.get<std::string>());
    }
    return out;
}

std::string get_string(const nlohmann::json &sec, const std::string &origin, const char *section,
                       const char *key)
{
    const auto &v = sec.at(key);
    if (!v.is_string())
        type_error(origin, section, key, "a string");
    return v.get<std::string>();
}

int64_t get_int(const nlohmann::json &sec, const std::string &origin, const char *section,
                const char *key, int64_t min_value)
{
    const auto &v = sec.at(key);
    if (!v.is_number_integer())
        type_error(origin, section, key, "an integer");
    const auto n = v.get<int64_t>();
    if (n < min_value)
    {
        throw std::runtime_error(fmt::format("Config '{}': '{}.{}' must be >= {} (got {})",
                                             origin, section, key, min_value, n));
    }
    return n;
}

bool get_bool(const nlohmann::json &sec, const std::string &origin, const char *section,
              const char *key)
{
    const auto &v = sec.at(key);
    if (!v.is_boolean())
        type_error(origin, section, key, "a boolean");
    return v.get<bool>();
}

// Returns the named section, or nullptr if absent. A non-object section is a type error.
const nlohmann::json *section_of(const nlohmann::json &j, const std::string &origin,
                                 const char *name)
{
    if (!j.contains(name))
        return nullptr;
    const auto &sec = j.at(name);
    if (!sec.is_object())
    {
        throw std::runtime_error(
            fmt::format("Config '{}': '{}' must be an object", origin, name));
    }
    return &sec;
}

} // anonymous namespace

void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

void RunConfig::apply_json(const nlohmann::json &j, const std::string &origin)
{
    if (!j.is_object())
    {
        throw std::runtime_error(
            fmt::format("Config '{}': top level must be a JSON object", origin));
    }

    if (const auto *e = section_of(j, origin, "engine"))
    {
        if (e->contains("command"))
        {
            auto cmd = get_string_list(*e, origin, "engine", "command");
            if (cmd.empty())
            {
                throw std::runtime_error(
                    fmt::format("Config '{}': 'engine.command' must not be empty", origin));
            }
            engine.command = std::move(cmd);
        }
        if (e->contains("test_dir"))
            engine.test_dir = get_string(*e, origin, "engine", "test_dir");
        if (e->contains("extra_args"))
            engine.extra_args = get_string_list(*e, origin, "engine", "extra_args");
    }
    if (const auto *p = section_of(j, origin, "pipe"))
    {
        if (p->contains("read_chunk_size"))
            pipe.read_chunk_size =
                static_cast<std::size_t>(get_int(*p, origin, "pipe", "read_chunk_size", 1));
        if (p->contains("read_poll_ms"))
            pipe.read_poll =
                std::chrono::milliseconds(get_int(*p, origin, "pipe", "read_poll_ms", 1));
        if (p->contains("exit_grace_ms"))
            pipe.exit_grace =
                std::chrono::milliseconds(get_int(*p, origin, "pipe", "exit_grace_ms", 0));
    }
    if (const auto *d = section_of(j, origin, "display"))
    {
        if (d->contains("width"))
            display.width = static_cast<int>(get_int(*d, origin, "display", "width", 1));
        if (d->contains("height"))
            display.height = static_cast<int>(get_int(*d, origin, "display", "height", 1));
        if (d->contains("std_symbols"))
            display.std_symbols = get_bool(*d, origin, "display", "std_symbols");
    }
    if (const auto *l = section_of(j, origin, "logging"))
    {
        if (l->contains("level"))
        {
            auto lvl = get_string(*l, origin, "logging", "level");
            if (!Logger::level_from_string(lvl))
            {
                throw std::runtime_error(
                    fmt::format("Config '{}': unknown log level '{}'", origin, lvl));
            }
            logging.level = std::move(lvl);
        }
        if (l->contains("file"))
            logging.file = get_string(*l, origin, "logging", "file");
    }
}

void RunConfig::apply_env_overrides()
{
    if (const char *env = std::getenv("TESTPIPE_LOG_LEVEL"))
    {
        if (Logger::level_from_string(env))
            logging.level = env;
        else
            LOGGER_WARN("RunConfig: ignoring unknown TESTPIPE_LOG_LEVEL '{}'", env);
    }
    if (const char *env = std::getenv("TESTPIPE_LOG_FILE"))
        logging.file = env;
    if (const char *env = std::getenv("TESTPIPE_TEST_DIR"))
        engine.test_dir = env;
}

nlohmann::json RunConfig::to_json() const
{
    return nlohmann::json{
        {"engine",
         {{"command", engine.command},
          {"test_dir", engine.test_dir},
          {"extra_args", engine.extra_args}}},
        {"pipe",
         {{"read_chunk_size", pipe.read_chunk_size},
          {"read_poll_ms", pipe.read_poll.count()},
          {"exit_grace_ms", pipe.exit_grace.count()}}},
        {"display",
         {{"width", display.width},
          {"height", display.height},
          {"std_symbols", display.std_symbols}}},
        {"logging", {{"level", logging.level}, {"file", logging.file}}},
    };
}

fs::path RunConfig::discover_config_dir()
{
    if (const char *env = std::getenv("TESTPIPE_CONFIG_DIR"))
        return fs::path(env);

    const std::string exe = platform::get_executable_name(true);
    if (exe.empty() || exe == "unknown")
        return {};
    std::error_code ec;
    fs::path candidate = fs::path(exe).parent_path() / ".." / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);
    return {};
}

RunConfig RunConfig::load_file(const fs::path &file)
{
    RunConfig cfg;
    LOGGER_INFO("RunConfig: loading '{}'", file.string());
    cfg.apply_json(read_json_file(file), file.string());
    cfg.sources.push_back(file);
    return cfg;
}

RunConfig RunConfig::load_layered(const fs::path &config_dir)
{
    RunConfig cfg;
    nlohmann::json merged = nlohmann::json::object();

    const fs::path def_file = config_dir / kDefaultFileName;
    const fs::path user_file = config_dir / kUserFileName;
    std::error_code ec;

    if (fs::exists(def_file, ec))
    {
        LOGGER_INFO("RunConfig: loading defaults from '{}'", def_file.string());
        auto jdef = read_json_file(def_file);
        // Validate each layer on its own so errors name the right file.
        RunConfig{}.apply_json(jdef, def_file.string());
        json_merge(merged, jdef);
        cfg.sources.push_back(def_file);
    }
    else
    {
        LOGGER_INFO("RunConfig: {} not found, using built-in defaults", kDefaultFileName);
    }

    if (fs::exists(user_file, ec))
    {
        LOGGER_INFO("RunConfig: merging user overrides from '{}'", user_file.string());
        auto juser = read_json_file(user_file);
        RunConfig{}.apply_json(juser, user_file.string());
        json_merge(merged, juser);
        cfg.sources.push_back(user_file);
    }

    cfg.apply_json(merged, config_dir.string());
    return cfg;
}

RunConfig RunConfig::load(const fs::path &explicit_file)
{
    RunConfig cfg;
    if (!explicit_file.empty())
    {
        cfg = load_file(explicit_file);
    }
    else if (const char *env = std::getenv("TESTPIPE_CONFIG_FILE"))
    {
        cfg = load_file(fs::path(env));
    }
    else if (fs::path dir = discover_config_dir(); !dir.empty())
    {
        cfg = load_layered(dir);
    }
    else
    {
        LOGGER_INFO("RunConfig: no config directory found, using built-in defaults");
    }

    cfg.apply_env_overrides();

    LOGGER_DEBUG("RunConfig: engine.command  = {}", fmt::join(cfg.engine.command, " "));
    LOGGER_DEBUG("RunConfig: engine.test_dir = {}", cfg.engine.test_dir);
    LOGGER_DEBUG("RunConfig: display         = {}x{}", cfg.display.width, cfg.display.height);
    LOGGER_DEBUG("RunConfig: logging.level   = {}", cfg.logging.level);
    return cfg;
}

} // namespace testpipe::utils
