#include <chrono>
#include <iostream>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>
#include <mpi.h>

#include "config.hpp"
#include "sweep.hpp"
#include "utils.hpp"

using namespace std;

int main(int argc, char* argv[]) {
    MPI_Init(&argc, &argv);

    int world_rank, world_size;
    MPI_Comm_rank(MPI_COMM_WORLD, &world_rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world_size);

    const string prog = argc > 0 ? argv[0] : "sim-5";

    // Every rank parses the same argv, so all agree on validity
    ParseResult parsed;
    try {
        parsed = parse_args(vector<string>(argv + 1, argv + argc));
    } catch (const invalid_argument& e) {
        if (world_rank == 0) {
            cerr << "error: " << e.what() << "\n";
            print_usage(cerr, prog);
        }
        MPI_Finalize();
        return 1;
    }

    if (parsed.help) {
        if (world_rank == 0)
            print_usage(cout, prog);
        MPI_Finalize();
        return 0;
    }

    SweepConfig config = parsed.config;

    try {
        config.seed = agree_on_seed(config, MPI_COMM_WORLD);

        if (config.verbose) {
            log_process_layout(MPI_COMM_WORLD);
            if (world_rank == 0)
                log_run_parameters(config, world_size);
        }

        MPI_Barrier(MPI_COMM_WORLD);
        auto t1 = chrono::high_resolution_clock::now();
        vector<Aggregate> results = run_sweep(config, cout, MPI_COMM_WORLD);
        MPI_Barrier(MPI_COMM_WORLD);
        auto t2 = chrono::high_resolution_clock::now();

        if (config.verbose && world_rank == 0)
            log_timing(chrono::duration<double>(t2 - t1).count(), results.size());

    } catch (const bad_alloc&) {
        cerr << "fatal: out of memory for a " << config.side << "x" << config.side
             << " lattice (rank " << world_rank << ")\n";
        MPI_Abort(MPI_COMM_WORLD, 2);
    } catch (const exception& e) {
        // Config was validated identically everywhere, so this is a local I/O or
        // logic failure; the other ranks may be blocked in a collective.
        cerr << "fatal: " << e.what() << " (rank " << world_rank << ")\n";
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Finalize();
    return 0;
}
