#include "lattice.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

void check_side(int side) {
    if (side <= 0) {
        throw std::invalid_argument("lattice side must be positive, got " + std::to_string(side));
    }
    // N^2 cells must stay addressable through int indices
    if (side > std::numeric_limits<int>::max() / side) {
        throw std::invalid_argument("lattice side too large: " + std::to_string(side));
    }
}

void check_probability(double p) {
    if (std::isnan(p) || p < 0.0 || p > 1.0) {
        throw std::invalid_argument("occupation probability must lie in [0, 1], got " + std::to_string(p));
    }
}

void generate_lattice(Lattice& lattice, int side, double p, std::mt19937_64& rng) {
    check_side(side);
    check_probability(p);

    lattice.side = side;
    lattice.cells.resize(static_cast<std::size_t>(side) * side);

    // u in [0,1) so p = 0 never occupies and p = 1 always does
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    for (CellState& c : lattice.cells) {
        c = uniform(rng) < p ? CellState::Occupied : CellState::Empty;
    }
}

Lattice generate_lattice(int side, double p, std::mt19937_64& rng) {
    Lattice lattice;
    generate_lattice(lattice, side, p, rng);
    return lattice;
}

std::uint64_t count_state(const Lattice& lattice, CellState state) {
    return static_cast<std::uint64_t>(
        std::count(lattice.cells.begin(), lattice.cells.end(), state));
}
