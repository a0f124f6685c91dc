#ifndef CONFIG_HPP
#define CONFIG_HPP
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "spreader.hpp"

constexpr std::uint64_t DEFAULT_SAMPLE_COUNT = 10000;
constexpr int DEFAULT_RESOLUTION = 100;
constexpr int MIN_RESOLUTION = 3;

struct SweepConfig {
    int side = 0;
    int resolution = DEFAULT_RESOLUTION;
    double p_min = 0.0;
    double p_max = 1.0;
    std::vector<double> probabilities;   // ascending
    std::uint64_t sample_count = DEFAULT_SAMPLE_COUNT;
    std::uint64_t seed = 0;
    bool seed_given = false;
    SpreadRule rule;
    bool print_stats = false;
    bool verbose = false;
};

struct ParseResult {
    SweepConfig config;
    bool help = false;
};

// Parse argv[1..] into a validated config. Throws std::invalid_argument
// naming the offending argument. Does not touch MPI or the streams.
ParseResult parse_args(const std::vector<std::string>& args);

// Equidistant points p_min + i*(p_max-p_min)/resolution, i = 0..resolution.
std::vector<double> make_probabilities(int resolution, double p_min, double p_max);

void validate_config(const SweepConfig& config);

void print_usage(std::ostream& os, const std::string& prog);

#endif // CONFIG_HPP
