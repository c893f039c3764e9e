#pragma once

#include <memory>
#include <optional>

#include "game_session.hpp"

struct CellPos {
    int row;
    int col;
};

enum class BoardButton { Clear, NewGame, Solve };

// Key codes as delivered by cv::waitKey, masked to the low byte
constexpr int KEY_BACKSPACE = 8;
constexpr int KEY_ESCAPE = 27;
constexpr int KEY_DELETE = 127;
constexpr int KEY_DELETE_GTK = 255;

/**
 * Turns key presses, button presses and cell selections into GameSession
 * calls, and tracks the selected cell and the "play again?" prompt shown
 * after a win. Knows nothing about windows or drawing.
 */
class GameController {
public:
    explicit GameController(std::unique_ptr<GameSession> session);

    const GameSession& session() const { return *session_; }
    std::optional<CellPos> selected() const { return selected_; }
    bool asking_play_again() const { return ask_play_again; }

    void select(CellPos p);
    void press(BoardButton b);

    // Returns false when the user asked to quit
    bool handle_key(int key);

private:
    std::unique_ptr<GameSession> session_;
    std::optional<CellPos> selected_;
    bool ask_play_again;

    void new_game();
    void enter_digit(int digit);
    void move_selection(int dr, int dc);
};
