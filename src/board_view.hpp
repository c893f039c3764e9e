#pragma once

#include <optional>
#include <opencv2/core.hpp>

#include "game_controller.hpp"
#include "game_session.hpp"

struct BoardViewOptions {
    int cell_size = 64;
    int margin = 16;
    int button_height = 48;
};

// Draws a GameSession into an image and maps mouse positions back to cells
// and buttons. Holds no game state of its own.
class BoardView {
public:
    explicit BoardView(const BoardViewOptions& options = BoardViewOptions());

    cv::Size canvas_size() const;

    cv::Mat render(const GameSession& session, std::optional<CellPos> selected,
                   bool ask_play_again) const;

    std::optional<CellPos> cell_at(const cv::Point& p) const;
    std::optional<BoardButton> button_at(const cv::Point& p) const;

private:
    BoardViewOptions opts;

    int board_px() const { return opts.cell_size * GRID_SIZE; }
    cv::Rect cell_rect(int row, int col) const;
    cv::Rect button_rect(BoardButton b) const;

    void draw_digit(cv::Mat& canvas, const cv::Rect& cell, int digit, const cv::Scalar& color) const;
    void draw_banner(cv::Mat& canvas) const;
};
