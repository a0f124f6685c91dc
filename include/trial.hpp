#ifndef TRIAL_HPP
#define TRIAL_HPP
#include <cstdint>
#include <random>

#include "lattice.hpp"
#include "spreader.hpp"

struct TrialResult {
    const double p;
    const std::uint64_t steps;
};

TrialResult make_trial_result(double p, std::uint64_t steps);

// Generate a fresh lattice and burn it; only the step count leaves the call.
std::uint64_t run_trial(int side, double p, const SpreadRule& rule, std::mt19937_64& rng);

// Same, regenerating the caller's scratch lattice instead of allocating.
std::uint64_t run_trial(Lattice& scratch, int side, double p,
                        const SpreadRule& rule, std::mt19937_64& rng);

#endif // TRIAL_HPP
