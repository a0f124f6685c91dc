#ifndef LATTICE_HPP
#define LATTICE_HPP
#include <cstdint>
#include <random>
#include <vector>

enum class CellState : std::uint8_t {
    Empty,
    Occupied,
    Burning,
    Burnt
};

// Square N x N lattice, row-major.
struct Lattice {
    int side = 0;
    std::vector<CellState> cells;
};

inline int idx(int side, int i, int j) {
    return i * side + j;
}

// Refill `lattice` in place: every cell is Occupied with probability p, else Empty.
// Existing capacity is reused, so one lattice can serve as scratch for many trials.
void generate_lattice(Lattice& lattice, int side, double p, std::mt19937_64& rng);
Lattice generate_lattice(int side, double p, std::mt19937_64& rng);

void check_side(int side);
void check_probability(double p);

std::uint64_t count_state(const Lattice& lattice, CellState state);

#endif // LATTICE_HPP
