#ifndef SPREADER_HPP
#define SPREADER_HPP
#include <cstdint>
#include <vector>

#include "lattice.hpp"

enum class Neighborhood { VonNeumann, Moore };
enum class Boundary { Open, Periodic };
enum class IgnitionEdge { Left, Top };

struct SpreadRule {
    Neighborhood neighborhood = Neighborhood::VonNeumann;
    Boundary boundary = Boundary::Open;
    IgnitionEdge edge = IgnitionEdge::Left;
};

// Set every Occupied cell on the ignition edge to Burning.
// Returns the burning cells (row-major indices); empty means nothing ignites.
std::vector<int> ignite(Lattice& lattice, const SpreadRule& rule);

// One synchronous step. Cells in `frontier` burn out, their Occupied
// neighbours start burning and are written to `next_frontier`.
// Returns true while something is still burning.
bool burn_step(Lattice& lattice,
               const std::vector<int>& frontier,
               std::vector<int>& next_frontier,
               const SpreadRule& rule);

// Ignite and burn until no cell is Burning.
// Returns the number of step transitions (0 when the edge has no occupied cell).
std::uint64_t spread_to_quiescence(Lattice& lattice, const SpreadRule& rule);

#endif // SPREADER_HPP
