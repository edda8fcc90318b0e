// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions and store doubles for the tests.
 */
#include "shared_test_helpers.h"

#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

#include <fmt/format.h>

#include "utils/errors.hpp"
#include "utils/uid_utils.hpp"

namespace kanbanhub::tests::helper
{

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        auto end = text.find('\n', pos);
        auto line = text.substr(pos, end - pos);

        if ((!must_include || line.find(*must_include) != std::string_view::npos) &&
            (!must_exclude || line.find(*must_exclude) == std::string_view::npos))
        {
            ++count;
        }

        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }

    return count;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected, std::chrono::milliseconds timeout)
{
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout)
    {
        std::string contents;
        if (read_file_contents(path.string(), contents))
        {
            if (contents.find(expected) != std::string::npos)
                return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

fs::path unique_temp_path(const std::string &stem, const std::string &extension)
{
    return fs::temp_directory_path() / fmt::format("kanbanhub_test_{}_{}{}", stem, uid::generate_uuid(), extension);
}

void remove_quietly(const fs::path &path) noexcept
{
    std::error_code ec;
    fs::remove(path, ec);
}

// ---------------------------------------------------------------------------
// RecordingStore
// ---------------------------------------------------------------------------

void RecordingStore::transaction(const std::function<void()> &body)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_begins;
    }
    try
    {
        body();
    }
    catch (...)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_rollbacks;
        }
        throw;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_commits;
}

void RecordingStore::exec(std::string_view sql)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_directives.emplace_back(sql);
    if (m_failing_exec && m_failing_exec->first == sql)
        throw StoreError(fmt::format("exec failed: {}", sql), m_failing_exec->second);
}

std::vector<std::string> RecordingStore::directives() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_directives;
}

std::size_t RecordingStore::directive_count(std::string_view sql) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t n = 0;
    for (const auto &d : m_directives)
    {
        if (d == sql)
            ++n;
    }
    return n;
}

int RecordingStore::begins() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_begins;
}

int RecordingStore::commits() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commits;
}

int RecordingStore::rollbacks() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rollbacks;
}

void RecordingStore::fail_exec_on(std::string sql, int store_code)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failing_exec = std::make_pair(std::move(sql), store_code);
}

// ---------------------------------------------------------------------------
// ServiceFixture
// ---------------------------------------------------------------------------

int ServiceFixture::count_rows(const std::string &table, const std::string &where, const std::string &arg)
{
    auto sql = fmt::format("SELECT COUNT(*) FROM {}", table);
    if (!where.empty())
        sql += " WHERE " + where;
    auto st = db.prepare(sql);
    if (!where.empty())
        st.bind(1, arg);
    return st.step() ? st.column_int(0) : 0;
}

} // namespace kanbanhub::tests::helper
