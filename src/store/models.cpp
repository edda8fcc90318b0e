#include "store/models.hpp"

namespace kanbanhub::store
{

namespace
{

nlohmann::json optional_json(const std::optional<std::string> &v)
{
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

template <typename T> void read_optional(const nlohmann::json &j, const char *key, std::optional<T> &out)
{
    if (j.contains(key) && !j.at(key).is_null())
        out = j.at(key).get<T>();
}

template <typename T> void read_or_keep(const nlohmann::json &j, const char *key, T &out)
{
    if (j.contains(key) && !j.at(key).is_null())
        out = j.at(key).get<T>();
}

} // namespace

void to_json(nlohmann::json &j, const Board &v)
{
    j = nlohmann::json{{"id", v.id},
                       {"name", v.name},
                       {"description", optional_json(v.description)},
                       {"created_at", v.created_at},
                       {"updated_at", v.updated_at},
                       {"archived", v.archived}};
}

void to_json(nlohmann::json &j, const Column &v)
{
    j = nlohmann::json{{"id", v.id},          {"board_id", v.board_id}, {"name", v.name},
                       {"position", v.position}, {"color", v.color},       {"created_at", v.created_at}};
}

void to_json(nlohmann::json &j, const Task &v)
{
    j = nlohmann::json{{"id", v.id},
                       {"board_id", v.board_id},
                       {"column_id", v.column_id},
                       {"parent_task_id", optional_json(v.parent_task_id)},
                       {"title", v.title},
                       {"description", v.description},
                       {"position", v.position},
                       {"priority", v.priority},
                       {"due_date", optional_json(v.due_date)},
                       {"created_at", v.created_at},
                       {"updated_at", v.updated_at},
                       {"archived", v.archived}};
}

void to_json(nlohmann::json &j, const Tag &v)
{
    j = nlohmann::json{{"id", v.id},
                       {"name", v.name},
                       {"slug", v.slug},
                       {"parent_id", optional_json(v.parent_id)},
                       {"path", v.path},
                       {"color", v.color},
                       {"description", v.description},
                       {"usage_count", v.usage_count},
                       {"created_at", v.created_at}};
}

void to_json(nlohmann::json &j, const TaskTag &v)
{
    j = nlohmann::json{{"task_id", v.task_id}, {"tag_id", v.tag_id}, {"created_at", v.created_at}};
}

void to_json(nlohmann::json &j, const TaskDependency &v)
{
    j = nlohmann::json{{"id", v.id},
                       {"task_id", v.task_id},
                       {"depends_on_task_id", v.depends_on_task_id},
                       {"dependency_type", v.dependency_type},
                       {"created_at", v.created_at}};
}

void to_json(nlohmann::json &j, const Note &v)
{
    j = nlohmann::json{{"id", v.id},
                       {"task_id", optional_json(v.task_id)},
                       {"board_id", v.board_id},
                       {"title", v.title},
                       {"content", v.content},
                       {"category", v.category},
                       {"pinned", v.pinned},
                       {"author", v.author},
                       {"created_at", v.created_at},
                       {"updated_at", v.updated_at}};
}

void from_json(const nlohmann::json &j, CreateBoardRequest &v)
{
    j.at("name").get_to(v.name);
    read_optional(j, "description", v.description);
}

void from_json(const nlohmann::json &j, CreateTaskRequest &v)
{
    j.at("title").get_to(v.title);
    read_or_keep(j, "description", v.description);
    read_optional(j, "board_id", v.board_id);
    read_optional(j, "column_id", v.column_id);
    read_optional(j, "parent_task_id", v.parent_task_id);
    read_optional(j, "position", v.position);
    read_or_keep(j, "priority", v.priority);
    read_optional(j, "due_date", v.due_date);
}

void from_json(const nlohmann::json &j, CreateTagRequest &v)
{
    j.at("name").get_to(v.name);
    read_optional(j, "parent_id", v.parent_id);
    read_optional(j, "color", v.color);
    read_or_keep(j, "description", v.description);
}

void from_json(const nlohmann::json &j, CreateNoteRequest &v)
{
    read_optional(j, "task_id", v.task_id);
    j.at("board_id").get_to(v.board_id);
    read_or_keep(j, "title", v.title);
    j.at("content").get_to(v.content);
    read_or_keep(j, "category", v.category);
    read_or_keep(j, "pinned", v.pinned);
    read_or_keep(j, "author", v.author);
}

} // namespace kanbanhub::store
