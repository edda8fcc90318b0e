/**
 * @file service_config.cpp
 * @brief Layered configuration load: defaults, then file, then environment.
 */
#include "utils/service_config.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>

#include <fmt/format.h>

#include "utils/errors.hpp"

namespace kanbanhub
{

namespace fs = std::filesystem;

namespace
{

nlohmann::json builtin_defaults()
{
    return nlohmann::json{
        {"database", {{"path", "kanban.db"}, {"busy_timeout_ms", 5000}, {"wal", true}}},
        {"logging", {{"level", "info"}, {"file", ""}}},
        {"transactions",
         {{"timeout_ms", 0},
          {"retry_attempts", 0},
          {"retry_base_delay_ms", 100},
          {"retry_max_delay_ms", 5000}}},
    };
}

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
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

/// Reads a JSON file. Returns std::nullopt if the file cannot be opened.
/// @throws ValidationError if the content is not valid JSON.
std::optional<nlohmann::json> read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return std::nullopt;
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ValidationError(fmt::format("Config file '{}' is not valid JSON: {}", path.string(), e.what()));
    }
}

const nlohmann::json &section(const nlohmann::json &j, const char *name)
{
    const auto &s = j.at(name);
    if (!s.is_object())
        throw ValidationError(fmt::format("Config section '{}' must be an object", name));
    return s;
}

std::string get_string(const nlohmann::json &s, const char *section_name, const char *key)
{
    const auto &v = s.at(key);
    if (!v.is_string())
        throw ValidationError(fmt::format("Config key '{}.{}' must be a string", section_name, key));
    return v.get<std::string>();
}

long long get_non_negative(const nlohmann::json &s, const char *section_name, const char *key)
{
    const auto &v = s.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 0)
        throw ValidationError(
            fmt::format("Config key '{}.{}' must be a non-negative integer", section_name, key));
    return v.get<long long>();
}

utils::Logger::Level parse_level_or_throw(const std::string &name)
{
    auto lvl = utils::Logger::parse_level(name);
    if (!lvl)
        throw ValidationError(fmt::format("Unknown log level '{}'", name));
    return *lvl;
}

} // anonymous namespace

ServiceConfig::ServiceConfig() : m_raw(builtin_defaults()) {}

void ServiceConfig::apply_json(const nlohmann::json &j)
{
    json_merge(m_raw, j);

    const auto &db = section(m_raw, "database");
    m_database_path = get_string(db, "database", "path");
    if (m_database_path.empty())
        throw ValidationError("Config key 'database.path' must not be empty");
    m_busy_timeout = std::chrono::milliseconds(get_non_negative(db, "database", "busy_timeout_ms"));
    if (!db.at("wal").is_boolean())
        throw ValidationError("Config key 'database.wal' must be a boolean");
    m_wal = db.at("wal").get<bool>();

    const auto &lg = section(m_raw, "logging");
    m_log_level = parse_level_or_throw(get_string(lg, "logging", "level"));
    m_log_file = get_string(lg, "logging", "file");

    const auto &tx = section(m_raw, "transactions");
    m_txn_timeout = std::chrono::milliseconds(get_non_negative(tx, "transactions", "timeout_ms"));
    m_retry_attempts = static_cast<int>(get_non_negative(tx, "transactions", "retry_attempts"));
    m_retry_backoff.base =
        std::chrono::milliseconds(get_non_negative(tx, "transactions", "retry_base_delay_ms"));
    m_retry_backoff.max =
        std::chrono::milliseconds(get_non_negative(tx, "transactions", "retry_max_delay_ms"));
    if (m_retry_backoff.max < m_retry_backoff.base)
        throw ValidationError("Config key 'transactions.retry_max_delay_ms' is below retry_base_delay_ms");
}

void ServiceConfig::apply_env()
{
    nlohmann::json env = nlohmann::json::object();
    if (const char *v = std::getenv("KANBANHUB_DB_PATH"))
        env["database"]["path"] = v;
    if (const char *v = std::getenv("KANBANHUB_LOG_LEVEL"))
        env["logging"]["level"] = v;
    if (const char *v = std::getenv("KANBANHUB_LOG_FILE"))
        env["logging"]["file"] = v;
    if (!env.empty())
    {
        LOGGER_DEBUG("ServiceConfig: applying environment overrides {}", env.dump());
        apply_json(env);
    }
}

ServiceConfig ServiceConfig::from_json(const nlohmann::json &overrides)
{
    if (!overrides.is_null() && !overrides.is_object())
        throw ValidationError("Config root must be a JSON object");
    ServiceConfig cfg;
    cfg.apply_json(overrides);
    return cfg;
}

ServiceConfig ServiceConfig::load(const fs::path &override_path)
{
    ServiceConfig cfg;

    fs::path file = override_path;
    if (file.empty())
    {
        if (const char *env = std::getenv("KANBANHUB_CONFIG_FILE"))
            file = env;
    }

    if (!file.empty())
    {
        auto j = read_json_file(file);
        if (j)
        {
            if (!j->is_object())
                throw ValidationError(fmt::format("Config file '{}' must hold a JSON object", file.string()));
            LOGGER_INFO("ServiceConfig: loading '{}'", file.string());
            cfg.apply_json(*j);
        }
        else
        {
            LOGGER_WARN("ServiceConfig: config file '{}' not readable, using defaults", file.string());
        }
    }

    cfg.apply_env();
    return cfg;
}

bool ServiceConfig::apply_logging() const
{
    auto &logger = utils::Logger::instance();
    logger.set_level(m_log_level);
    if (m_log_file.empty())
        return logger.set_console();
    return logger.set_logfile(m_log_file);
}

} // namespace kanbanhub
