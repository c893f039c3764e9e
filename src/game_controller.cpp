#include "game_controller.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

GameController::GameController(std::unique_ptr<GameSession> session)
    : session_(std::move(session)), ask_play_again(false) {
    if (!session_) {
        throw std::invalid_argument("game controller needs a session");
    }
}

void GameController::select(CellPos p) {
    if (p.row < 0 || p.row >= GRID_SIZE || p.col < 0 || p.col >= GRID_SIZE) {
        throw std::out_of_range("selected cell is outside the 9x9 grid");
    }
    selected_ = p;
}

void GameController::press(BoardButton b) {
    switch (b) {
        case BoardButton::Clear:
            session_->clear();
            ask_play_again = false;
            break;
        case BoardButton::NewGame:
            new_game();
            break;
        case BoardButton::Solve:
            session_->reveal_solution();
            ask_play_again = false;
            break;
    }
}

bool GameController::handle_key(int key) {
    if (ask_play_again) {
        if (key == 'y') new_game();
        else if (key == 'n') ask_play_again = false;
        else if (key == 'q' || key == KEY_ESCAPE) return false;
        return true;
    }

    if (key >= '1' && key <= '9') {
        enter_digit(key - '0');
    } else if (key == '0' || key == ' ' || key == KEY_BACKSPACE || key == KEY_DELETE || key == KEY_DELETE_GTK) {
        enter_digit(0);
    } else {
        switch (key) {
            case 'c': press(BoardButton::Clear); break;
            case 'n': press(BoardButton::NewGame); break;
            case 's': press(BoardButton::Solve); break;
            case 'i': move_selection(-1, 0); break;
            case 'k': move_selection(1, 0); break;
            case 'j': move_selection(0, -1); break;
            case 'l': move_selection(0, 1); break;
            case 'q':
            case KEY_ESCAPE:
                return false;
            default:
                break;
        }
    }
    return true;
}

void GameController::new_game() {
    auto start = std::chrono::high_resolution_clock::now();
    session_->new_game();
    auto end = std::chrono::high_resolution_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    std::cout << "New puzzle with " << session_->filled_count() << " clues took: " << ms << " ms" << std::endl;
    selected_.reset();
    ask_play_again = false;
}

void GameController::enter_digit(int digit) {
    if (!selected_) return;

    EntryFeedback f = session_->enter(selected_->row, selected_->col, digit);
    if (f == EntryFeedback::Locked) return;

    if (session_->is_won()) {
        std::cout << "Puzzle solved!" << std::endl;
        ask_play_again = true;
    }
}

void GameController::move_selection(int dr, int dc) {
    CellPos p = selected_.value_or(CellPos{ 0, 0 });
    p.row = (p.row + dr + GRID_SIZE) % GRID_SIZE;
    p.col = (p.col + dc + GRID_SIZE) % GRID_SIZE;
    selected_ = p;
}
