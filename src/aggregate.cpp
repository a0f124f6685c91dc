#include "aggregate.hpp"

#include <cmath>
#include <stdexcept>

#include "lattice.hpp"
#include "trial.hpp"

double Aggregate::standard_error() const {
    if (sample_count == 0) return 0.0;
    return std::sqrt(variance / static_cast<double>(sample_count));
}

void BurnAccumulator::add(const TrialResult& trial) {
    const std::uint64_t steps = trial.steps;
    ++count;
    sum += steps;
    sum_sq += steps * steps;
}

void BurnAccumulator::merge(const BurnAccumulator& other) {
    count += other.count;
    sum += other.sum;
    sum_sq += other.sum_sq;
}

Aggregate BurnAccumulator::to_aggregate(double p) const {
    if (count == 0) {
        throw std::logic_error("cannot aggregate zero burn-time samples");
    }

    const long double n = static_cast<long double>(count);
    const long double s = static_cast<long double>(sum);
    const long double mean = s / n;

    long double var = 0.0L;
    if (count > 1) {
        var = (static_cast<long double>(sum_sq) - s * mean) / (n - 1.0L);
        if (var < 0.0L) var = 0.0L; // rounding
    }

    Aggregate a;
    a.p = p;
    a.mean_steps = static_cast<double>(mean);
    a.variance = static_cast<double>(var);
    a.sample_count = count;
    return a;
}

std::mt19937_64 make_rank_rng(std::uint64_t seed, int rank) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(seed & 0xffffffffu),
        static_cast<std::uint32_t>(seed >> 32),
        static_cast<std::uint32_t>(rank)
    };
    return std::mt19937_64(seq);
}

void check_sample_count(std::uint64_t sample_count) {
    if (sample_count == 0) {
        throw std::invalid_argument("sample count must be positive");
    }
}

Aggregate aggregate(int side, double p, std::uint64_t sample_count,
                    const SpreadRule& rule, std::mt19937_64& rng) {
    check_sample_count(sample_count);
    check_side(side);
    check_probability(p);

    Lattice scratch;
    BurnAccumulator acc;
    for (std::uint64_t t = 0; t < sample_count; ++t) {
        acc.add(make_trial_result(p, run_trial(scratch, side, p, rule, rng)));
    }
    return acc.to_aggregate(p);
}

Aggregate aggregate_mpi(int side, double p, std::uint64_t sample_count,
                        const SpreadRule& rule, std::mt19937_64& rank_rng,
                        MPI_Comm comm) {
    check_sample_count(sample_count);
    check_side(side);
    check_probability(p);

    int rank, size;
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);

    // Round-robin split: trial t belongs to rank t % size
    Lattice scratch;
    BurnAccumulator local;
    for (std::uint64_t t = static_cast<std::uint64_t>(rank); t < sample_count;
         t += static_cast<std::uint64_t>(size)) {
        local.add(make_trial_result(p, run_trial(scratch, side, p, rule, rank_rng)));
    }

    std::uint64_t send[3] = {local.count, local.sum, local.sum_sq};
    std::uint64_t recv[3] = {0, 0, 0};
    MPI_Allreduce(send, recv, 3, MPI_UINT64_T, MPI_SUM, comm);

    BurnAccumulator total;
    total.count = recv[0];
    total.sum = recv[1];
    total.sum_sq = recv[2];
    return total.to_aggregate(p);
}
