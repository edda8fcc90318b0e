#include "store/tag_service.hpp"

#include "utils/errors.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

namespace kanbanhub::store
{

namespace
{

constexpr const char *kTagColumns =
    "id, name, slug, parent_id, path, color, description, usage_count, created_at";

Tag read_tag(const Statement &st)
{
    return Tag{.id = st.column_text(0),
               .name = st.column_text(1),
               .slug = st.column_text(2),
               .parent_id = st.column_optional_text(3),
               .path = st.column_text(4),
               .color = st.column_text(5),
               .description = st.column_text(6),
               .usage_count = st.column_int(7),
               .created_at = st.column_text(8)};
}

} // namespace

Tag TagService::create_tag(const CreateTagRequest &request)
{
    if (request.name.empty())
        throw ValidationError("Tag name must not be empty");
    const auto slug = format_tools::slugify(request.name);
    if (slug.empty())
        throw ValidationError(fmt::format("Tag name '{}' has no usable characters", request.name));

    std::string path = slug;
    if (request.parent_id)
    {
        auto parent = get_tag(*request.parent_id);
        if (!parent)
            throw NotFoundError("Tag", *request.parent_id);
        path = parent->path + "/" + slug;
    }

    Tag tag{.id = uid::generate_uuid(),
            .name = request.name,
            .slug = slug,
            .parent_id = request.parent_id,
            .path = path,
            .color = request.color.value_or("#6b7280"),
            .description = request.description,
            .usage_count = 0,
            .created_at = format_tools::iso8601_now()};

    m_db.prepare("INSERT INTO tags (id, name, slug, parent_id, path, color, description, usage_count, created_at) "
                 "VALUES (?, ?, ?, ?, ?, ?, ?, 0, ?)")
        .bind_all(tag.id, tag.name, tag.slug, tag.parent_id, tag.path, tag.color, tag.description, tag.created_at)
        .run();

    LOGGER_DEBUG("TagService: created tag {} '{}'", tag.id, tag.path);
    return tag;
}

std::optional<Tag> TagService::get_tag(const std::string &id)
{
    auto st = m_db.prepare(fmt::format("SELECT {} FROM tags WHERE id = ?", kTagColumns));
    st.bind(1, id);
    if (!st.step())
        return std::nullopt;
    return read_tag(st);
}

std::optional<Tag> TagService::find_tag_by_name(const std::string &name)
{
    auto st = m_db.prepare(fmt::format("SELECT {} FROM tags WHERE name = ?", kTagColumns));
    st.bind(1, name);
    if (!st.step())
        return std::nullopt;
    return read_tag(st);
}

bool TagService::delete_tag(const std::string &id)
{
    m_db.prepare("DELETE FROM tags WHERE id = ?").bind(1, id).run();
    return m_db.changes() > 0;
}

TaskTag TagService::add_tag_to_task(const std::string &task_id, const std::string &tag_id)
{
    {
        auto st = m_db.prepare("SELECT 1 FROM tasks WHERE id = ?");
        st.bind(1, task_id);
        if (!st.step())
            throw NotFoundError("Task", task_id);
    }
    if (!get_tag(tag_id))
        throw NotFoundError("Tag", tag_id);

    TaskTag link{.task_id = task_id, .tag_id = tag_id, .created_at = format_tools::iso8601_now()};
    m_db.prepare("INSERT INTO task_tags (task_id, tag_id, created_at) VALUES (?, ?, ?)")
        .bind_all(link.task_id, link.tag_id, link.created_at)
        .run();
    m_db.prepare("UPDATE tags SET usage_count = usage_count + 1 WHERE id = ?").bind(1, tag_id).run();
    return link;
}

bool TagService::remove_tag_from_task(const std::string &task_id, const std::string &tag_id)
{
    m_db.prepare("DELETE FROM task_tags WHERE task_id = ? AND tag_id = ?").bind_all(task_id, tag_id).run();
    if (m_db.changes() == 0)
        return false;
    m_db.prepare("UPDATE tags SET usage_count = MAX(usage_count - 1, 0) WHERE id = ?").bind(1, tag_id).run();
    return true;
}

std::vector<Tag> TagService::get_task_tags(const std::string &task_id)
{
    auto st = m_db.prepare("SELECT t.id, t.name, t.slug, t.parent_id, t.path, t.color, t.description, "
                           "t.usage_count, t.created_at FROM tags t "
                           "JOIN task_tags tt ON tt.tag_id = t.id WHERE tt.task_id = ? ORDER BY t.name");
    st.bind(1, task_id);
    std::vector<Tag> tags;
    while (st.step())
        tags.push_back(read_tag(st));
    return tags;
}

} // namespace kanbanhub::store
