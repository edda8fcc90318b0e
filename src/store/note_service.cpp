#include "store/note_service.hpp"

#include "utils/errors.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

namespace kanbanhub::store
{

namespace
{

constexpr const char *kNoteColumns =
    "id, task_id, board_id, title, content, category, pinned, author, created_at, updated_at";

Note read_note(const Statement &st)
{
    return Note{.id = st.column_text(0),
                .task_id = st.column_optional_text(1),
                .board_id = st.column_text(2),
                .title = st.column_text(3),
                .content = st.column_text(4),
                .category = st.column_text(5),
                .pinned = st.column_bool(6),
                .author = st.column_text(7),
                .created_at = st.column_text(8),
                .updated_at = st.column_text(9)};
}

bool is_valid_category(const std::string &c)
{
    return c == "implementation" || c == "research" || c == "blocker" || c == "idea" || c == "general";
}

void insert_note(Database &db, const Note &note)
{
    db.prepare("INSERT INTO notes (id, task_id, board_id, title, content, category, pinned, author, "
               "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)")
        .bind_all(note.id, note.task_id, note.board_id, note.title, note.content, note.category, note.pinned,
                  note.author, note.created_at, note.updated_at)
        .run();
}

} // namespace

Note NoteService::create_note(const CreateNoteRequest &request)
{
    if (request.content.empty())
        throw ValidationError("Note content must not be empty");
    if (!is_valid_category(request.category))
        throw ValidationError(fmt::format("Unknown note category '{}'", request.category));
    {
        auto st = m_db.prepare("SELECT 1 FROM boards WHERE id = ?");
        st.bind(1, request.board_id);
        if (!st.step())
            throw NotFoundError("Board", request.board_id);
    }
    if (request.task_id)
    {
        auto st = m_db.prepare("SELECT 1 FROM tasks WHERE id = ?");
        st.bind(1, *request.task_id);
        if (!st.step())
            throw NotFoundError("Task", *request.task_id);
    }

    const auto now = format_tools::iso8601_now();
    Note note{.id = uid::generate_uuid(),
              .task_id = request.task_id,
              .board_id = request.board_id,
              .title = request.title,
              .content = request.content,
              .category = request.category,
              .pinned = request.pinned,
              .author = request.author,
              .created_at = now,
              .updated_at = now};
    insert_note(m_db, note);
    return note;
}

std::vector<Note> NoteService::get_task_notes(const std::string &task_id)
{
    auto st = m_db.prepare(fmt::format(
        "SELECT {} FROM notes WHERE task_id = ? ORDER BY pinned DESC, created_at, id", kNoteColumns));
    st.bind(1, task_id);
    std::vector<Note> notes;
    while (st.step())
        notes.push_back(read_note(st));
    return notes;
}

std::vector<Note> NoteService::delete_task_notes(const std::string &task_id)
{
    auto notes = get_task_notes(task_id);
    if (!notes.empty())
    {
        m_db.prepare("DELETE FROM notes WHERE task_id = ?").bind(1, task_id).run();
        LOGGER_DEBUG("NoteService: deleted {} notes of task {}", notes.size(), task_id);
    }
    return notes;
}

void NoteService::restore_note(const Note &snapshot)
{
    auto st = m_db.prepare("SELECT 1 FROM notes WHERE id = ?");
    st.bind(1, snapshot.id);
    if (st.step())
        return;
    insert_note(m_db, snapshot);
}

} // namespace kanbanhub::store
