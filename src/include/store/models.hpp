#pragma once
/**
 * @file models.hpp
 * @brief Row types of the task/board store and the request types that create them.
 *
 * Timestamps are ISO-8601 UTC strings (format_tools::iso8601). Each type has
 * nlohmann::json conversions; the JSON field names are the column names.
 */
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kanbanhub::store
{

struct Board
{
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::string created_at;
    std::string updated_at;
    bool archived = false;
};

struct Column
{
    std::string id;
    std::string board_id;
    std::string name;
    int position = 0;
    std::string color{"#6b7280"};
    std::string created_at;
};

struct Task
{
    std::string id;
    std::string board_id;
    std::string column_id;
    std::optional<std::string> parent_task_id;
    std::string title;
    std::string description;
    int position = 0;
    std::string priority{"medium"};
    std::optional<std::string> due_date;
    std::string created_at;
    std::string updated_at;
    bool archived = false;
};

struct Tag
{
    std::string id;
    std::string name;
    std::string slug;
    std::optional<std::string> parent_id;
    std::string path;
    std::string color{"#6b7280"};
    std::string description;
    int usage_count = 0;
    std::string created_at;
};

struct TaskTag
{
    std::string task_id;
    std::string tag_id;
    std::string created_at;
};

struct TaskDependency
{
    std::string id;
    std::string task_id;            ///< the blocked task
    std::string depends_on_task_id; ///< the task it waits for
    std::string dependency_type{"blocks"};
    std::string created_at;
};

struct Note
{
    std::string id;
    std::optional<std::string> task_id;
    std::string board_id;
    std::string title;
    std::string content;
    std::string category{"general"};
    bool pinned = false;
    std::string author{"system"};
    std::string created_at;
    std::string updated_at;
};

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

struct CreateBoardRequest
{
    std::string name;
    std::optional<std::string> description;
};

/// board_id / column_id may be left empty when a composite operation fills them in.
struct CreateTaskRequest
{
    std::string title;
    std::string description;
    std::optional<std::string> board_id;
    std::optional<std::string> column_id;
    std::optional<std::string> parent_task_id;
    std::optional<int> position; ///< append when absent
    std::string priority{"medium"};
    std::optional<std::string> due_date;
};

struct CreateTagRequest
{
    std::string name;
    std::optional<std::string> parent_id;
    std::optional<std::string> color;
    std::string description;
};

struct CreateNoteRequest
{
    std::optional<std::string> task_id;
    std::string board_id;
    std::string title;
    std::string content;
    std::string category{"general"};
    bool pinned = false;
    std::string author{"system"};
};

void to_json(nlohmann::json &j, const Board &v);
void to_json(nlohmann::json &j, const Column &v);
void to_json(nlohmann::json &j, const Task &v);
void to_json(nlohmann::json &j, const Tag &v);
void to_json(nlohmann::json &j, const TaskTag &v);
void to_json(nlohmann::json &j, const TaskDependency &v);
void to_json(nlohmann::json &j, const Note &v);

/// @throws nlohmann::json::exception on a missing required field or a wrong type.
void from_json(const nlohmann::json &j, CreateBoardRequest &v);
void from_json(const nlohmann::json &j, CreateTaskRequest &v);
void from_json(const nlohmann::json &j, CreateTagRequest &v);
void from_json(const nlohmann::json &j, CreateNoteRequest &v);

} // namespace kanbanhub::store
