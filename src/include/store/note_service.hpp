#pragma once
/**
 * @file note_service.hpp
 * @brief Notes attached to boards and tasks.
 */
#include <string>
#include <vector>

#include "store/database.hpp"
#include "store/models.hpp"

namespace kanbanhub::store
{

class NoteService
{
  public:
    explicit NoteService(Database &db) : m_db(db) {}

    /**
     * @throws ValidationError if content is empty or the category is unknown.
     * @throws NotFoundError if the board or task is missing.
     */
    Note create_note(const CreateNoteRequest &request);

    /// Notes on @p task_id, pinned first, then oldest first.
    std::vector<Note> get_task_notes(const std::string &task_id);

    /// Deletes every note on @p task_id and returns what was deleted.
    std::vector<Note> delete_task_notes(const std::string &task_id);

    /// Re-inserts a deleted note with its original id. No-op if it already exists.
    void restore_note(const Note &snapshot);

  private:
    Database &m_db;
};

} // namespace kanbanhub::store
