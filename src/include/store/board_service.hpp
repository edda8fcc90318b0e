#pragma once
/**
 * @file board_service.hpp
 * @brief Boards and their columns.
 */
#include <array>
#include <optional>
#include <string>
#include <vector>

#include "store/database.hpp"
#include "store/models.hpp"

namespace kanbanhub::store
{

class BoardService
{
  public:
    /// Columns created with every new board, in position order.
    static constexpr std::array<const char *, 3> kDefaultColumns{"Todo", "In Progress", "Done"};

    explicit BoardService(Database &db) : m_db(db) {}

    /**
     * @brief Inserts a board and its default columns.
     * @throws ValidationError if the name is empty.
     * @throws ConflictError if a board with the same name exists.
     */
    Board create_board(const CreateBoardRequest &request);

    std::optional<Board> get_board(const std::string &id);

    /// @throws NotFoundError
    Board require_board(const std::string &id);

    /// Columns of @p board_id ordered by position.
    std::vector<Column> get_columns(const std::string &board_id);

    std::optional<Column> get_column(const std::string &column_id);

    /**
     * @brief Deletes a board with its columns, tasks and notes.
     * @return false if no such board existed.
     */
    bool delete_board(const std::string &id);

  private:
    Database &m_db;
};

} // namespace kanbanhub::store
