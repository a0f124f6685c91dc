#include "utils.hpp"

#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

std::string format_row(const Aggregate& a, bool with_stats) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(P_PRECISION) << a.p << '\t'
       << std::setprecision(T_PRECISION) << a.mean_steps;
    if (with_stats) {
        ss << '\t' << a.variance << '\t' << a.standard_error();
    }
    return ss.str();
}

void write_row(std::ostream& out, const Aggregate& a, bool with_stats) {
    out << format_row(a, with_stats) << '\n';
    out.flush();

    if (!out) {
        throw std::runtime_error("Cannot write result row");
    }
}

void log_process_layout(MPI_Comm comm) {
    int world_rank, world_size;
    MPI_Comm_rank(comm, &world_rank);
    MPI_Comm_size(comm, &world_size);
    char hostname[MPI_MAX_PROCESSOR_NAME] = {};
    int name_len;
    MPI_Get_processor_name(hostname, &name_len);

    // Gather all hostnames at rank 0
    std::vector<char> all_hosts(world_rank == 0 ? world_size * MPI_MAX_PROCESSOR_NAME : 0);

    MPI_Gather(hostname, MPI_MAX_PROCESSOR_NAME, MPI_CHAR,
               all_hosts.data(), MPI_MAX_PROCESSOR_NAME, MPI_CHAR,
               0, comm);

    if (world_rank != 0)
        return;

    // Count processes per host
    std::map<std::string, int> count;
    for (int r = 0; r < world_size; r++) {
        std::string host(&all_hosts[r * MPI_MAX_PROCESSOR_NAME]);
        count[host]++;
    }

    std::cerr << "\n=== MPI Process Layout ===\n";
    for (auto& kv : count) {
        std::cerr << kv.first << " : " << kv.second << " processes\n";
    }
    std::cerr << "==========================\n\n";
}

void log_run_parameters(const SweepConfig& config, int ranks) {
    const char* nb = config.rule.neighborhood == Neighborhood::Moore ? "8" : "4";
    const char* bc = config.rule.boundary == Boundary::Periodic ? "periodic" : "open";
    const char* edge = config.rule.edge == IgnitionEdge::Top ? "top" : "left";

    std::cerr << "=== Burn-time sweep ===\n"
              << "Lattice side : " << config.side << "\n"
              << "Samples      : " << config.sample_count << " per point\n"
              << "Points       : " << config.probabilities.size()
              << " in [" << config.p_min << ", " << config.p_max << "]\n"
              << "Rule         : " << nb << "-neighbour, " << bc << " boundary, "
              << edge << " edge ignition\n"
              << "Seed         : " << config.seed << (config.seed_given ? "" : " (random)") << "\n"
              << "Ranks        : " << ranks << "\n"
              << "=======================\n";
}

void log_timing(double seconds, std::size_t points) {
    std::cerr << "\n=== Timing Results ===\n"
              << "Sweep        : " << seconds << " sec\n"
              << "Per point    : " << (points ? seconds / points : 0.0) << " sec\n";
}
