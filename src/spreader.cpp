#include "spreader.hpp"

// Row/column offsets; the first 4 are the von Neumann neighbours
static const int DI[8] = {-1, 1, 0, 0, -1, -1, 1, 1};
static const int DJ[8] = {0, 0, -1, 1, -1, 1, -1, 1};

static int neighbor_count(Neighborhood n) {
    return n == Neighborhood::Moore ? 8 : 4;
}

std::vector<int> ignite(Lattice& lattice, const SpreadRule& rule) {
    const int N = lattice.side;
    std::vector<int> frontier;
    frontier.reserve(N);

    for (int k = 0; k < N; ++k) {
        int c = (rule.edge == IgnitionEdge::Left) ? idx(N, k, 0) : idx(N, 0, k);
        if (lattice.cells[c] == CellState::Occupied) {
            lattice.cells[c] = CellState::Burning;
            frontier.push_back(c);
        }
    }
    return frontier;
}

bool burn_step(Lattice& lattice,
               const std::vector<int>& frontier,
               std::vector<int>& next_frontier,
               const SpreadRule& rule) {
    const int N = lattice.side;
    const int nb = neighbor_count(rule.neighborhood);
    const bool periodic = (rule.boundary == Boundary::Periodic);

    next_frontier.clear();

    // Only cells burning at the start of the step spread. A neighbour set to
    // Burning here is not in `frontier`, so it cannot spread until next step.
    for (int c : frontier) {
        int i = c / N;
        int j = c % N;

        for (int k = 0; k < nb; ++k) {
            int ni = i + DI[k];
            int nj = j + DJ[k];

            if (periodic) {
                ni = (ni + N) % N;
                nj = (nj + N) % N;
            } else if (ni < 0 || ni >= N || nj < 0 || nj >= N) {
                continue;
            }

            int n = idx(N, ni, nj);
            if (lattice.cells[n] == CellState::Occupied) {
                lattice.cells[n] = CellState::Burning;
                next_frontier.push_back(n);
            }
        }
    }

    for (int c : frontier)
        lattice.cells[c] = CellState::Burnt;

    return !next_frontier.empty();
}

std::uint64_t spread_to_quiescence(Lattice& lattice, const SpreadRule& rule) {
    std::vector<int> frontier = ignite(lattice, rule);
    if (frontier.empty())
        return 0;

    std::vector<int> next_frontier;
    next_frontier.reserve(frontier.size());

    std::uint64_t steps = 0;
    bool burning = true;
    while (burning) {
        burning = burn_step(lattice, frontier, next_frontier, rule);
        ++steps;

        // Swap
        frontier.swap(next_frontier);
    }
    return steps;
}
