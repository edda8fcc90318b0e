#pragma once

#include <cstdio>
#include <filesystem>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace kanbanhub::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a single file.
 *
 * The file is opened in append mode on construction; missing parent directories are
 * created. Only the logger's worker thread writes to a sink, so no locking is done here.
 */
class FileSink : public Sink
{
  public:
    /// @throws std::system_error if the file cannot be opened.
    explicit FileSink(const std::filesystem::path &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /// @throws std::system_error on a short write.
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    std::FILE *m_file = nullptr;
};

} // namespace kanbanhub::utils
