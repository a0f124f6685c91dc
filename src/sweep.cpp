#include "sweep.hpp"

#include <random>

#include "utils.hpp"

std::uint64_t agree_on_seed(const SweepConfig& config, MPI_Comm comm) {
    if (config.seed_given)
        return config.seed;

    int rank;
    MPI_Comm_rank(comm, &rank);

    std::uint64_t seed = 0;
    if (rank == 0) {
        std::random_device rd;
        seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    }
    MPI_Bcast(&seed, 1, MPI_UINT64_T, 0, comm);
    return seed;
}

std::vector<Aggregate> run_sweep(const SweepConfig& config, std::ostream& out, MPI_Comm comm) {
    validate_config(config);

    int rank;
    MPI_Comm_rank(comm, &rank);

    std::mt19937_64 rng = make_rank_rng(config.seed, rank);

    std::vector<Aggregate> results;
    results.reserve(config.probabilities.size());

    for (double p : config.probabilities) {
        Aggregate a = aggregate_mpi(config.side, p, config.sample_count,
                                    config.rule, rng, comm);
        if (rank == 0)
            write_row(out, a, config.print_stats);
        results.push_back(a);
    }
    return results;
}
