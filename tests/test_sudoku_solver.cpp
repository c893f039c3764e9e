#include "sudoku_solver.hpp"
#include "test_common.hpp"

#include <chrono>

int main() {
    TestReport t;
    SudokuSolver solver;

    const Grid puzzle = classic_puzzle();
    std::cout << "Solving puzzle:\n";
    print_grid(puzzle);

    auto start = std::chrono::high_resolution_clock::now();
    std::optional<Grid> result = solver.solve(puzzle);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::micro> elapsed = end - start;

    std::cout << "\nStatus: " << (result ? "Solved" : "Unsolvable") << "\n";
    std::cout << "Time: " << elapsed.count() << " microseconds\n\n";
    if (result) print_grid(*result);

    t.check(result.has_value(), "classic puzzle is solved");
    t.check(result && *result == classic_solution(), "classic puzzle matches its known solution");
    t.check(solver.count_solutions(puzzle, 2) == 1, "classic puzzle has exactly one solution");

    // Solving a solved grid changes nothing
    const Grid solution = classic_solution();
    std::optional<Grid> again = solver.solve(solution);
    t.check(again && *again == solution, "solved grid comes back unchanged");
    std::optional<Grid> twice = solver.solve(*again);
    t.check(twice && *twice == solution, "second solve is idempotent");
    t.check(solver.count_solutions(solution, 2) == 1, "solved grid counts as one solution");

    // Empty grid with digits tried in order 1..9
    Grid empty{};
    std::optional<Grid> first = solver.solve(empty);
    std::optional<Grid> second = solver.solve(empty);
    t.check(first && is_complete_solution(*first), "empty grid is solved to a valid board");
    t.check(first && second && *first == *second, "empty grid solution is deterministic");
    bool first_row_ascending = first.has_value();
    for (int c = 0; first && c < GRID_SIZE; ++c)
        if ((*first)[cell_index(0, c)] != c + 1) first_row_ascending = false;
    t.check(first_row_ascending, "first row of the empty-grid solution is 1..9");
    t.check(solver.count_solutions(empty, 2) == 2, "empty grid count stops at the limit of 2");
    t.check(solver.count_solutions(empty, 5) == 5, "empty grid count stops at the limit of 5");

    // Dropping any single cell of a solution leaves it uniquely solvable
    bool single_holes_unique = true;
    for (int i = 0; i < CELL_COUNT; ++i) {
        Grid g = solution;
        g[i] = 0;
        if (solver.count_solutions(g, 2) != 1) single_holes_unique = false;
    }
    t.check(single_holes_unique, "one missing cell always has a unique completion");

    // Givens that already clash
    Grid clash{};
    clash[cell_index(0, 0)] = 5;
    clash[cell_index(0, 4)] = 5;
    t.check(!solver.solve(clash).has_value(), "duplicate givens are unsolvable");
    t.check(solver.count_solutions(clash, 2) == 0, "duplicate givens have zero solutions");

    // Same digit twice in one box, different rows and columns
    Grid box_clash{};
    box_clash[cell_index(3, 3)] = 7;
    box_clash[cell_index(5, 4)] = 7;
    t.check(!solver.solve(box_clash).has_value(), "duplicate givens in a box are unsolvable");
    t.check(solver.count_solutions(box_clash, 2) == 0, "duplicate givens in a box have zero solutions");

    // Consistent givens but no completion: (0,8) needs a 9 that column 8 already has
    Grid dead{};
    for (int c = 0; c < 8; ++c) dead[cell_index(0, c)] = c + 1;
    dead[cell_index(4, 8)] = 9;
    t.check(!solver.solve(dead).has_value(), "dead end grid is unsolvable");
    t.check(solver.count_solutions(dead, 2) == 0, "dead end grid has zero solutions");

    // The solver reuses its buffers between calls
    std::optional<Grid> after = solver.solve(puzzle);
    t.check(after && *after == solution, "solver is reusable after an unsolvable grid");

    // Randomised digit order still gives valid boards
    std::mt19937 rng(7);
    SudokuSolver shuffled(rng);
    std::optional<Grid> r1 = shuffled.solve(empty);
    std::optional<Grid> r2 = shuffled.solve(empty);
    t.check(r1 && is_complete_solution(*r1), "shuffled solver fills an empty grid");
    t.check(r2 && is_complete_solution(*r2), "shuffled solver fills it again");
    t.check(r1 && r2 && *r1 != *r2, "shuffled solver gives different boards");
    std::optional<Grid> r3 = shuffled.solve(puzzle);
    t.check(r3 && *r3 == solution, "shuffled solver finds the unique solution");

    Grid bad{};
    bad[3] = 12;
    t.expect_throw([&] { (void)solver.solve(bad); }, "value outside 0..9 throws");
    t.expect_throw([&] { (void)solver.count_solutions(puzzle, 0); }, "limit below 1 throws");
    t.expect_throw([] { (void)make_grid({ {1, 2, 3} }); }, "malformed grid dimensions throw");

    return t.summary();
}
