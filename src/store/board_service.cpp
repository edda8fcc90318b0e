#include "store/board_service.hpp"

#include "utils/errors.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

namespace kanbanhub::store
{

namespace
{

constexpr const char *kBoardColumns = "id, name, description, created_at, updated_at, archived";
constexpr const char *kColumnColumns = "id, board_id, name, position, color, created_at";

Board read_board(const Statement &st)
{
    return Board{.id = st.column_text(0),
                 .name = st.column_text(1),
                 .description = st.column_optional_text(2),
                 .created_at = st.column_text(3),
                 .updated_at = st.column_text(4),
                 .archived = st.column_bool(5)};
}

Column read_column(const Statement &st)
{
    return Column{.id = st.column_text(0),
                  .board_id = st.column_text(1),
                  .name = st.column_text(2),
                  .position = st.column_int(3),
                  .color = st.column_text(4),
                  .created_at = st.column_text(5)};
}

} // namespace

Board BoardService::create_board(const CreateBoardRequest &request)
{
    if (request.name.empty())
        throw ValidationError("Board name must not be empty");

    const auto now = format_tools::iso8601_now();
    Board board{.id = uid::generate_uuid(),
                .name = request.name,
                .description = request.description,
                .created_at = now,
                .updated_at = now,
                .archived = false};

    m_db.prepare("INSERT INTO boards (id, name, description, created_at, updated_at, archived) "
                 "VALUES (?, ?, ?, ?, ?, 0)")
        .bind_all(board.id, board.name, board.description, board.created_at, board.updated_at)
        .run();

    int position = 0;
    for (const char *name : kDefaultColumns)
    {
        m_db.prepare("INSERT INTO columns (id, board_id, name, position, created_at) VALUES (?, ?, ?, ?, ?)")
            .bind_all(uid::generate_uuid(), board.id, name, position++, now)
            .run();
    }

    LOGGER_DEBUG("BoardService: created board {} '{}'", board.id, board.name);
    return board;
}

std::optional<Board> BoardService::get_board(const std::string &id)
{
    auto st = m_db.prepare(fmt::format("SELECT {} FROM boards WHERE id = ?", kBoardColumns));
    st.bind(1, id);
    if (!st.step())
        return std::nullopt;
    return read_board(st);
}

Board BoardService::require_board(const std::string &id)
{
    auto board = get_board(id);
    if (!board)
        throw NotFoundError("Board", id);
    return *board;
}

std::vector<Column> BoardService::get_columns(const std::string &board_id)
{
    auto st = m_db.prepare(
        fmt::format("SELECT {} FROM columns WHERE board_id = ? ORDER BY position", kColumnColumns));
    st.bind(1, board_id);
    std::vector<Column> columns;
    while (st.step())
        columns.push_back(read_column(st));
    return columns;
}

std::optional<Column> BoardService::get_column(const std::string &column_id)
{
    auto st = m_db.prepare(fmt::format("SELECT {} FROM columns WHERE id = ?", kColumnColumns));
    st.bind(1, column_id);
    if (!st.step())
        return std::nullopt;
    return read_column(st);
}

bool BoardService::delete_board(const std::string &id)
{
    // tasks.column_id is ON DELETE RESTRICT, so tasks go before the board cascade reaches
    // the columns.
    m_db.prepare("DELETE FROM tasks WHERE board_id = ?").bind(1, id).run();
    m_db.prepare("DELETE FROM boards WHERE id = ?").bind(1, id).run();
    const bool deleted = m_db.changes() > 0;
    if (deleted)
        LOGGER_DEBUG("BoardService: deleted board {}", id);
    return deleted;
}

} // namespace kanbanhub::store
