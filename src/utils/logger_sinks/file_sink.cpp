#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <system_error>

namespace kanbanhub::utils
{

FileSink::FileSink(const std::filesystem::path &path) : m_path(path)
{
    if (m_path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            throw std::system_error(ec, "Failed to create log directory '" +
                                            m_path.parent_path().string() + "'");
        }
    }
    m_file = std::fopen(m_path.string().c_str(), "a");
    if (m_file == nullptr)
    {
        throw std::system_error(errno, std::generic_category(),
                                "Failed to open log file '" + m_path.string() + "'");
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fclose(m_file);
    }
}

void FileSink::write(const LogMessage &msg)
{
    const auto line = render(msg);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::system_error(errno, std::generic_category(),
                                "Short write to log file '" + m_path.string() + "'");
    }
}

void FileSink::flush()
{
    std::fflush(m_file);
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace kanbanhub::utils
