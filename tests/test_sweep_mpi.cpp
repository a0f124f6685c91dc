#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <mpi.h>

#include "aggregate.hpp"
#include "config.hpp"
#include "sweep.hpp"

namespace {

// A failing rank must take the whole job down, not hang the others in a collective.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            MPI_Abort(MPI_COMM_WORLD, 1);                                       \
        }                                                                       \
    } while (0)

static std::vector<std::string> lines(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

static void runAggregateAcrossRanks(int rank) {
    SpreadRule rule;
    std::mt19937_64 rng = make_rank_rng(3, rank);

    Aggregate zero = aggregate_mpi(4, 0.0, 10, rule, rng, MPI_COMM_WORLD);
    REQUIRE(zero.sample_count == 10, "every trial counted once across ranks");
    REQUIRE(zero.mean_steps == 0.0, "p=0 mean");

    Aggregate full = aggregate_mpi(4, 1.0, 7, rule, rng, MPI_COMM_WORLD);
    REQUIRE(full.sample_count == 7 && full.mean_steps == 4.0 && full.variance == 0.0, "p=1 N=4");

    // Fewer samples than ranks leaves some ranks idle
    Aggregate one = aggregate_mpi(6, 1.0, 1, rule, rng, MPI_COMM_WORLD);
    REQUIRE(one.sample_count == 1 && one.mean_steps == 6.0, "single sample");

    bool threw = false;
    try {
        aggregate_mpi(4, 0.5, 0, rule, rng, MPI_COMM_WORLD);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    REQUIRE(threw, "sample_count=0 must be rejected before any collective");
}

static void runStreamedSweep(int rank) {
    ParseResult parsed = parse_args({"4", "-s", "5", "-r", "4", "--seed", "17"});
    SweepConfig config = parsed.config;
    config.seed = agree_on_seed(config, MPI_COMM_WORLD);
    REQUIRE(config.seed == 17, "explicit seed kept");

    std::ostringstream out;
    std::vector<Aggregate> results = run_sweep(config, out, MPI_COMM_WORLD);
    REQUIRE(results.size() == 5, "one aggregate per p");

    for (std::size_t k = 1; k < results.size(); ++k)
        REQUIRE(results[k - 1].p < results[k].p, "sweep not ascending");

    if (rank == 0) {
        std::vector<std::string> rows = lines(out.str());
        REQUIRE(rows.size() == 5, "rank 0 must write one row per p, got " << rows.size());
        REQUIRE(rows.front() == "0.0000\t0.00000", "first row: " << rows.front());
        REQUIRE(rows.back() == "1.0000\t4.00000", "last row: " << rows.back());
        REQUIRE(rows[2].compare(0, 7, "0.5000\t") == 0, "middle row: " << rows[2]);
    } else {
        REQUIRE(out.str().empty(), "only rank 0 writes rows");
    }

    // Same seed and rank count reproduce the sweep
    std::ostringstream again;
    std::vector<Aggregate> repeat = run_sweep(config, again, MPI_COMM_WORLD);
    for (std::size_t k = 0; k < results.size(); ++k)
        REQUIRE(repeat[k].mean_steps == results[k].mean_steps, "sweep not reproducible at k=" << k);
    REQUIRE(again.str() == out.str(), "rows not reproducible");
}

static void runRandomSeedAgreement(int rank) {
    ParseResult parsed = parse_args({"4"});
    std::uint64_t seed = agree_on_seed(parsed.config, MPI_COMM_WORLD);

    std::uint64_t root_seed = seed;
    MPI_Bcast(&root_seed, 1, MPI_UINT64_T, 0, MPI_COMM_WORLD);
    REQUIRE(seed == root_seed, "rank " << rank << " disagrees on the drawn seed");
}

} // namespace

int main(int argc, char* argv[]) {
    MPI_Init(&argc, &argv);

    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    runAggregateAcrossRanks(rank);
    runStreamedSweep(rank);
    runRandomSeedAgreement(rank);

    if (rank == 0)
        std::cout << "[PASS] test_sweep_mpi\n";

    MPI_Finalize();
    return 0;
}
