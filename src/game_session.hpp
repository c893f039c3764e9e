#pragma once

#include <array>
#include <cstdint>

#include "puzzle_generator.hpp"
#include "sudoku_grid.hpp"

enum class EntryFeedback {
    Empty,    // nothing typed in the cell
    Given,    // part of the puzzle
    Valid,    // no clash with the rest of the board
    Conflict, // repeats a digit in its row, column or box
    Revealed, // filled by reveal_solution()
    Locked    // returned by enter() when the cell cannot be edited
};

/**
 * One game: the generated puzzle, the digits the user typed on top of it and
 * the colour feedback of each cell. The puzzle itself never changes, so
 * clear() can always go back to it.
 */
class GameSession {
public:
    GameSession();
    explicit GameSession(uint32_t seed);

    void new_game();

    // digit 0 erases the cell
    EntryFeedback enter(int row, int col, int digit);

    void clear();
    void reveal_solution();

    bool is_won() const;
    bool is_revealed() const { return revealed; }

    int value(int row, int col) const;
    bool is_given(int row, int col) const;
    EntryFeedback feedback(int row, int col) const;
    int filled_count() const { return count_filled(board_); }

    const Puzzle& puzzle() const { return current; }
    const Grid& board() const { return board_; }

private:
    PuzzleGenerator generator;
    Puzzle current;
    Grid board_;
    std::array<EntryFeedback, CELL_COUNT> feedback_;
    bool revealed;

    void reset_board();
    static int checked_index(int row, int col);
};
