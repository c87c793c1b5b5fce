#pragma once

/**
 * @file run_config.hpp
 * @brief RunConfig: layered JSON configuration for the testpipe front end.
 *
 * ## Config loading, layered (priority low → high)
 *
 *  1. Built-in C++ defaults (the member initializers below)
 *  2. `<config_dir>/testpipe.default.json`: canonical defaults staged with the build
 *  3. `<config_dir>/testpipe.user.json`: user customisations, merged recursively
 *  4. `TESTPIPE_CONFIG_FILE` env var or an explicit `--config` path: a single
 *     file that replaces layers 2 and 3
 *  5. `TESTPIPE_LOG_LEVEL` / `TESTPIPE_LOG_FILE` / `TESTPIPE_TEST_DIR`: process
 *     overrides applied last
 *
 * The config directory is `$TESTPIPE_CONFIG_DIR`, else `<binary_dir>/../config/`
 * when it exists. Without one, RunConfig keeps the built-in defaults.
 *
 * Malformed JSON, or a known key holding a value of the wrong type, throws
 * `std::runtime_error` naming the offending file. The object is resolved once and
 * then passed around by value or const reference; there is no global instance.
 */

#include "tp_base.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace testpipe::utils
{

struct EngineSettings
{
    std::vector<std::string> command{"testpipe_demo_engine"};
    std::string test_dir{"tests"};
    std::vector<std::string> extra_args;
};

struct PipeSettings
{
    std::size_t read_chunk_size{1024};
    std::chrono::milliseconds read_poll{100};
    std::chrono::milliseconds exit_grace{500};
};

struct DisplaySettings
{
    int width{80};
    int height{24};
    bool std_symbols{false};
};

struct LoggingSettings
{
    std::string level{"info"};
    std::string file; ///< Empty selects the console sink.
};

class TESTPIPE_UTILS_EXPORT RunConfig
{
  public:
    EngineSettings engine;
    PipeSettings pipe;
    DisplaySettings display;
    LoggingSettings logging;

    /// Files that contributed to this configuration, in the order applied.
    std::vector<std::filesystem::path> sources;

    /**
     * @brief Full resolution: explicit file, else TESTPIPE_CONFIG_FILE, else the
     *        layered config directory; then the environment overrides.
     * @throws std::runtime_error on unreadable or malformed configuration.
     */
    static RunConfig load(const std::filesystem::path &explicit_file = {});

    /// Layers 1-3 only: defaults, then default.json merged with user.json.
    static RunConfig load_layered(const std::filesystem::path &config_dir);

    /// Layer 1 plus a single file.
    static RunConfig load_file(const std::filesystem::path &file);

    /// `$TESTPIPE_CONFIG_DIR`, else `<binary_dir>/../config`, else empty.
    static std::filesystem::path discover_config_dir();

    /**
     * @brief Applies every known key present in @p j on top of the current values.
     * @param origin Named in error messages (usually the file path).
     */
    void apply_json(const nlohmann::json &j, const std::string &origin);

    /// Applies TESTPIPE_LOG_LEVEL, TESTPIPE_LOG_FILE and TESTPIPE_TEST_DIR.
    void apply_env_overrides();

    nlohmann::json to_json() const;
};

/// Recursively merges @p overrides into @p base (object keys override, arrays replace).
TESTPIPE_UTILS_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);

} // namespace testpipe::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
