#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace testpipe::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a file shared by the front end and its engine.
 *
 * TESTPIPE_LOG_FILE is inherited by the engine process, so two writers routinely
 * append to the same path. Each line goes out in a single write() under an
 * advisory flock() so lines from the two processes never mix.
 */
class FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override { return "File: " + m_path.string(); }

  private:
    std::filesystem::path m_path;
#if defined(TESTPIPE_IS_POSIX)
    int m_fd = -1;
#else
    std::FILE *m_file = nullptr;
#endif
};

} // namespace testpipe::utils
