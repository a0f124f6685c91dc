#ifndef SWEEP_HPP
#define SWEEP_HPP
#include <cstdint>
#include <ostream>
#include <vector>
#include <mpi.h>

#include "aggregate.hpp"
#include "config.hpp"

// The configured seed, or one drawn on rank 0 and broadcast to all ranks.
std::uint64_t agree_on_seed(const SweepConfig& config, MPI_Comm comm);

// Aggregate every probability in order. Rank 0 writes and flushes one row
// per point as soon as it is reduced; other ranks write nothing.
// Returns the aggregates (identical on every rank).
std::vector<Aggregate> run_sweep(const SweepConfig& config, std::ostream& out, MPI_Comm comm);

#endif // SWEEP_HPP
