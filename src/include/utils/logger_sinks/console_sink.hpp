#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>

namespace testpipe::utils
{

// Writes to stderr. Inside an engine process stderr is /dev/null, so output is discarded.
class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_logmsg(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace testpipe::utils
