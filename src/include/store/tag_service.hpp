#pragma once
/**
 * @file tag_service.hpp
 * @brief Tags and task-tag links.
 */
#include <optional>
#include <string>
#include <vector>

#include "store/database.hpp"
#include "store/models.hpp"

namespace kanbanhub::store
{

class TagService
{
  public:
    explicit TagService(Database &db) : m_db(db) {}

    /**
     * @brief Creates a tag. The slug is derived from the name; the path is the parent's
     *        path plus the slug ("frontend/react").
     * @throws ValidationError if the name is empty or slugifies to nothing.
     * @throws NotFoundError if parent_id names a missing tag.
     * @throws ConflictError if the name or slug is taken.
     */
    Tag create_tag(const CreateTagRequest &request);

    std::optional<Tag> get_tag(const std::string &id);
    std::optional<Tag> find_tag_by_name(const std::string &name);

    /// @return false if no such tag existed.
    bool delete_tag(const std::string &id);

    /**
     * @brief Links a tag to a task and bumps the tag's usage count.
     * @throws NotFoundError if either side is missing.
     * @throws ConflictError if the link already exists.
     */
    TaskTag add_tag_to_task(const std::string &task_id, const std::string &tag_id);

    /// @return false if the link did not exist.
    bool remove_tag_from_task(const std::string &task_id, const std::string &tag_id);

    /// Tags linked to @p task_id, ordered by name.
    std::vector<Tag> get_task_tags(const std::string &task_id);

  private:
    Database &m_db;
};

} // namespace kanbanhub::store
