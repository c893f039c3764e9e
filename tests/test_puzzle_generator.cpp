#include "puzzle_generator.hpp"
#include "sudoku_solver.hpp"
#include "test_common.hpp"

#include <algorithm>
#include <chrono>
#include <string>

int main() {
    TestReport t;
    SudokuSolver solver;
    PuzzleGenerator generator(2024);

    Grid full = generator.generate_solution();
    t.check(is_complete_solution(full), "generated full board is a valid solution");
    t.check(generator.generate_solution() != full, "successive full boards differ");

    for (int round = 0; round < 3; ++round) {
        auto start = std::chrono::high_resolution_clock::now();
        Puzzle p = generator.generate_puzzle();
        auto end = std::chrono::high_resolution_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        const std::string tag = "puzzle " + std::to_string(round) + ": ";
        std::cout << "\nPuzzle " << round << " (" << count_filled(p.puzzle) << " clues, "
                  << ms << " ms):\n";
        print_grid(p.puzzle);

        t.check(is_complete_solution(p.solution), tag + "solution is complete");
        t.check(solver.count_solutions(p.puzzle, 2) == 1, tag + "exactly one solution");

        std::optional<Grid> solved = solver.solve(p.puzzle);
        t.check(solved && *solved == p.solution, tag + "solving gives back the paired solution");

        bool givens_match = true;
        for (int i = 0; i < CELL_COUNT; ++i)
            if (p.puzzle[i] != 0 && p.puzzle[i] != p.solution[i]) givens_match = false;
        t.check(givens_match, tag + "givens agree with the solution");
        t.check(count_filled(p.puzzle) < CELL_COUNT, tag + "some cells were carved");
        t.check(count_filled(p.puzzle) >= 17, tag + "at least 17 clues remain");
    }

    // Same seed, same sequence
    PuzzleGenerator a(99);
    PuzzleGenerator b(99);
    Puzzle pa = a.generate_puzzle();
    Puzzle pb = b.generate_puzzle();
    t.check(pa.puzzle == pb.puzzle && pa.solution == pb.solution, "a fixed seed reproduces the puzzle");
    t.check(a.generate_puzzle().solution != pa.solution, "the next puzzle from the same generator differs");

    // Seeds whose carve phase used to take several seconds
    for (uint32_t seed : { 147u, 181u }) {
        PuzzleGenerator g(seed);
        auto start = std::chrono::high_resolution_clock::now();
        Puzzle slow = g.generate_puzzle();
        auto end = std::chrono::high_resolution_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        std::cout << "Seed " << seed << " took: " << ms << " ms\n";
        t.check(ms < 1000, "seed " + std::to_string(seed) + " generates in under a second");
        t.check(solver.count_solutions(slow.puzzle, 2) == 1, "seed " + std::to_string(seed) + " puzzle is unique");
    }

    // Worst case over a run of seeds stays interactive
    long long worst = 0;
    for (uint32_t seed = 0; seed < 40; ++seed) {
        PuzzleGenerator g(seed);
        auto start = std::chrono::high_resolution_clock::now();
        (void)g.generate_puzzle();
        auto end = std::chrono::high_resolution_clock::now();
        worst = std::max<long long>(worst, std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());
    }
    std::cout << "Worst of seeds 0..39: " << worst << " ms\n";
    t.check(worst < 1000, "every one of 40 seeds generates in under a second");

    PuzzleGenerator seeded_randomly;
    Puzzle pr = seeded_randomly.generate_puzzle();
    t.check(solver.count_solutions(pr.puzzle, 2) == 1, "randomly seeded generator gives a unique puzzle");

    return t.summary();
}
