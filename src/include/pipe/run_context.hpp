#pragma once

/*******************************************************************************
 * @file run_context.hpp
 * @brief Per-process state of the front end, passed explicitly instead of globals.
 ******************************************************************************/

#include "pipe/codec.hpp"
#include "utils/run_config.hpp"

#include <utility>

namespace testpipe::pipe
{

/**
 * @class RunContext
 * @brief Owns the resolved configuration and the decode-side Codec.
 *
 * Constructed once per front-end process and handed by reference to the
 * components that need it. The Codec's root path is captured from the first
 * decoded engine configuration.
 */
class RunContext
{
  public:
    explicit RunContext(utils::RunConfig config) : m_config(std::move(config)) {}

    RunContext(const RunContext &) = delete;
    RunContext &operator=(const RunContext &) = delete;

    const utils::RunConfig &config() const noexcept { return m_config; }
    Codec &codec() noexcept { return m_codec; }

  private:
    utils::RunConfig m_config;
    Codec m_codec;
};

} // namespace testpipe::pipe
