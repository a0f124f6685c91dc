#ifndef AGGREGATE_HPP
#define AGGREGATE_HPP
#include <cstdint>
#include <random>
#include <mpi.h>

#include "spreader.hpp"
#include "trial.hpp"

struct Aggregate {
    double p = 0.0;
    double mean_steps = 0.0;
    double variance = 0.0;      // unbiased, 0 for a single sample
    std::uint64_t sample_count = 0;

    double standard_error() const;
};

// Exact integer moments of a set of burn times. Laid out as three
// uint64 values so ranks can sum them in one reduction.
struct BurnAccumulator {
    std::uint64_t count = 0;
    std::uint64_t sum = 0;
    std::uint64_t sum_sq = 0;

    void add(const TrialResult& trial);
    void merge(const BurnAccumulator& other);
    // Throws std::logic_error when nothing was accumulated.
    Aggregate to_aggregate(double p) const;
};

// Independent stream for one rank, reproducible from (seed, rank).
std::mt19937_64 make_rank_rng(std::uint64_t seed, int rank);

void check_sample_count(std::uint64_t sample_count);

// Sequential: sample_count trials on one random stream.
Aggregate aggregate(int side, double p, std::uint64_t sample_count,
                    const SpreadRule& rule, std::mt19937_64& rng);

// Distributed: each rank of `comm` runs its share of the trials on its own
// stream and lattice buffer; the partial sums are combined before any rank
// sees the result.
Aggregate aggregate_mpi(int side, double p, std::uint64_t sample_count,
                        const SpreadRule& rule, std::mt19937_64& rank_rng,
                        MPI_Comm comm);

#endif // AGGREGATE_HPP
