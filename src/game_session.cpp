#include "game_session.hpp"

#include <stdexcept>
#include <string>

#include "grid_validator.hpp"

GameSession::GameSession() : board_{}, revealed(false) {
    new_game();
}

GameSession::GameSession(uint32_t seed) : generator(seed), board_{}, revealed(false) {
    new_game();
}

void GameSession::new_game() {
    current = generator.generate_puzzle();
    reset_board();
}

EntryFeedback GameSession::enter(int row, int col, int digit) {
    const int idx = checked_index(row, col);
    if (digit < 0 || digit > 9) {
        throw std::out_of_range("digit " + std::to_string(digit) + " is outside 0..9");
    }
    if (revealed || current.puzzle[idx] != 0) {
        return EntryFeedback::Locked;
    }

    EntryFeedback result = EntryFeedback::Empty;
    if (digit != 0) {
        // Checked against the board as it is before this keystroke lands
        result = is_valid_placement(board_, row, col, digit) ? EntryFeedback::Valid
                                                             : EntryFeedback::Conflict;
    }

    board_[idx] = digit;
    feedback_[idx] = result;
    return result;
}

void GameSession::clear() {
    reset_board();
}

void GameSession::reveal_solution() {
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (current.puzzle[i] == 0) feedback_[i] = EntryFeedback::Revealed;
    }
    board_ = current.solution;
    revealed = true;
}

bool GameSession::is_won() const {
    return !revealed && board_ == current.solution;
}

int GameSession::value(int row, int col) const {
    return board_[checked_index(row, col)];
}

bool GameSession::is_given(int row, int col) const {
    return current.puzzle[checked_index(row, col)] != 0;
}

EntryFeedback GameSession::feedback(int row, int col) const {
    return feedback_[checked_index(row, col)];
}

void GameSession::reset_board() {
    board_ = current.puzzle;
    for (int i = 0; i < CELL_COUNT; ++i) {
        feedback_[i] = current.puzzle[i] != 0 ? EntryFeedback::Given : EntryFeedback::Empty;
    }
    revealed = false;
}

int GameSession::checked_index(int row, int col) {
    if (row < 0 || row >= GRID_SIZE || col < 0 || col >= GRID_SIZE) {
        throw std::out_of_range("cell (" + std::to_string(row) + ", " + std::to_string(col) +
                                ") is outside the 9x9 grid");
    }
    return cell_index(row, col);
}
