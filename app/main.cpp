#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <opencv2/highgui.hpp>

#include "app_options.hpp"
#include "board_view.hpp"
#include "game_controller.hpp"
#include "game_session.hpp"

namespace {

const char* WINDOW_NAME = "Sudoku";

struct App {
    std::unique_ptr<GameController> controller;
    std::unique_ptr<BoardView> view;
};

void on_mouse(int event, int x, int y, int, void* userdata) {
    if (event != cv::EVENT_LBUTTONDOWN) return;
    App& app = *static_cast<App*>(userdata);

    cv::Point p(x, y);
    if (auto cell = app.view->cell_at(p)) {
        app.controller->select(*cell);
    } else if (auto button = app.view->button_at(p)) {
        app.controller->press(*button);
    }
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [seed] [cell_size]" << std::endl;
    std::cerr << "  seed       unsigned 32-bit integer, fixes the puzzle sequence" << std::endl;
    std::cerr << "  cell_size  cell edge in pixels, 32..128 (default 64)" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    AppOptions options;
    try {
        options = parse_app_options(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return -1;
    }

    try {
        BoardViewOptions view_options;
        view_options.cell_size = options.cell_size;

        App app;
        app.view = std::make_unique<BoardView>(view_options);

        auto start = std::chrono::high_resolution_clock::now();
        auto session = options.seed ? std::make_unique<GameSession>(*options.seed) : std::make_unique<GameSession>();
        auto end = std::chrono::high_resolution_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        std::cout << "Puzzle with " << session->filled_count() << " clues took: " << ms << " ms" << std::endl;

        app.controller = std::make_unique<GameController>(std::move(session));

        cv::namedWindow(WINDOW_NAME, cv::WINDOW_AUTOSIZE);
        cv::setMouseCallback(WINDOW_NAME, on_mouse, &app);

        while (true) {
            const GameController& c = *app.controller;
            cv::imshow(WINDOW_NAME, app.view->render(c.session(), c.selected(), c.asking_play_again()));

            int key = cv::waitKey(30);
            if (cv::getWindowProperty(WINDOW_NAME, cv::WND_PROP_VISIBLE) < 1) break;
            if (key < 0) continue;
            if (!app.controller->handle_key(key & 0xFF)) break;
        }

        cv::destroyAllWindows();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
