#include "board_view.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <opencv2/imgproc.hpp>

namespace {

// BGR
const cv::Scalar WHITE(255, 255, 255);
const cv::Scalar LIGHT_GRAY(211, 211, 211);
const cv::Scalar SELECTED(170, 230, 255);
const cv::Scalar BLACK(0, 0, 0);
const cv::Scalar GREEN(0, 160, 0);
const cv::Scalar RED(0, 0, 220);
const cv::Scalar BLUE(200, 90, 0);
const cv::Scalar BUTTON(230, 230, 230);

const BoardButton BUTTONS[] = { BoardButton::Clear, BoardButton::NewGame, BoardButton::Solve };

const char* button_label(BoardButton b) {
    switch (b) {
        case BoardButton::Clear: return "Clear (c)";
        case BoardButton::NewGame: return "New (n)";
        case BoardButton::Solve: return "Solve (s)";
    }
    return "";
}

cv::Scalar digit_color(EntryFeedback f) {
    switch (f) {
        case EntryFeedback::Valid: return GREEN;
        case EntryFeedback::Conflict: return RED;
        case EntryFeedback::Revealed: return BLUE;
        default: return BLACK;
    }
}

void put_centered(cv::Mat& canvas, const std::string& text, const cv::Rect& area,
                  double scale, int thickness, const cv::Scalar& color) {
    int baseline = 0;
    cv::Size ts = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, thickness, &baseline);
    cv::Point org(area.x + (area.width - ts.width) / 2,
                  area.y + (area.height + ts.height) / 2);
    cv::putText(canvas, text, org, cv::FONT_HERSHEY_SIMPLEX, scale, color, thickness, cv::LINE_AA);
}

} // namespace

BoardView::BoardView(const BoardViewOptions& options) : opts(options) {
    if (opts.cell_size < 16 || opts.margin < 0 || opts.button_height < 16) {
        throw std::invalid_argument("board view dimensions are too small");
    }
}

cv::Size BoardView::canvas_size() const {
    return cv::Size(board_px() + 2 * opts.margin,
                    board_px() + 3 * opts.margin + opts.button_height);
}

cv::Rect BoardView::cell_rect(int row, int col) const {
    return cv::Rect(opts.margin + col * opts.cell_size, opts.margin + row * opts.cell_size,
                    opts.cell_size, opts.cell_size);
}

// Three buttons side by side under the board, one box wide each
cv::Rect BoardView::button_rect(BoardButton b) const {
    const int width = board_px() / 3;
    const int slot = static_cast<int>(b);
    const int pad = 4;
    return cv::Rect(opts.margin + slot * width + pad, 2 * opts.margin + board_px(),
                    width - 2 * pad, opts.button_height);
}

cv::Mat BoardView::render(const GameSession& session, std::optional<CellPos> selected,
                          bool ask_play_again) const {
    cv::Mat canvas(canvas_size(), CV_8UC3, WHITE);

    for (int r = 0; r < GRID_SIZE; ++r) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            cv::Rect cell = cell_rect(r, c);

            // Boxes alternate white / light gray like a checkerboard
            cv::Scalar bg = (r / BOX_N + c / BOX_N) % 2 == 0 ? WHITE : LIGHT_GRAY;
            if (selected && selected->row == r && selected->col == c) bg = SELECTED;
            cv::rectangle(canvas, cell, bg, cv::FILLED);
            cv::rectangle(canvas, cell, LIGHT_GRAY * 0.6, 1);

            int v = session.value(r, c);
            if (v != 0) draw_digit(canvas, cell, v, digit_color(session.feedback(r, c)));
        }
    }

    // Thick lines on box borders
    for (int k = 0; k <= GRID_SIZE; k += BOX_N) {
        int offset = opts.margin + k * opts.cell_size;
        cv::line(canvas, cv::Point(opts.margin, offset), cv::Point(opts.margin + board_px(), offset), BLACK, 3);
        cv::line(canvas, cv::Point(offset, opts.margin), cv::Point(offset, opts.margin + board_px()), BLACK, 3);
    }

    for (BoardButton b : BUTTONS) {
        cv::Rect rect = button_rect(b);
        cv::rectangle(canvas, rect, BUTTON, cv::FILLED);
        cv::rectangle(canvas, rect, BLACK, 1);
        put_centered(canvas, button_label(b), rect, 0.6, 1, BLACK);
    }

    if (ask_play_again) draw_banner(canvas);
    return canvas;
}

void BoardView::draw_digit(cv::Mat& canvas, const cv::Rect& cell, int digit, const cv::Scalar& color) const {
    const double scale = opts.cell_size / 40.0;
    const int thickness = std::max(1, opts.cell_size / 24);
    put_centered(canvas, std::to_string(digit), cell, scale, thickness, color);
}

void BoardView::draw_banner(cv::Mat& canvas) const {
    cv::Rect band(opts.margin, opts.margin + board_px() / 3, board_px(), board_px() / 3);

    cv::Mat roi = canvas(band);
    cv::Mat overlay(roi.size(), roi.type(), BLACK);
    cv::addWeighted(overlay, 0.7, roi, 0.3, 0.0, roi);

    cv::Rect top(band.x, band.y, band.width, band.height / 2);
    cv::Rect bottom(band.x, band.y + band.height / 2, band.width, band.height / 2);
    put_centered(canvas, "You have won!", top, opts.cell_size / 40.0, 2, WHITE);
    put_centered(canvas, "Play again? (y/n)", bottom, opts.cell_size / 64.0, 1, WHITE);
}

std::optional<CellPos> BoardView::cell_at(const cv::Point& p) const {
    const int x = p.x - opts.margin;
    const int y = p.y - opts.margin;
    if (x < 0 || y < 0 || x >= board_px() || y >= board_px()) return std::nullopt;
    return CellPos{ y / opts.cell_size, x / opts.cell_size };
}

std::optional<BoardButton> BoardView::button_at(const cv::Point& p) const {
    for (BoardButton b : BUTTONS) {
        if (button_rect(b).contains(p)) return b;
    }
    return std::nullopt;
}
