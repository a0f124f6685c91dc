#include "trial.hpp"

TrialResult make_trial_result(double p, std::uint64_t steps) {
    return TrialResult{p, steps};
}

std::uint64_t run_trial(int side, double p, const SpreadRule& rule, std::mt19937_64& rng) {
    Lattice lattice = generate_lattice(side, p, rng);
    return spread_to_quiescence(lattice, rule);
}

std::uint64_t run_trial(Lattice& scratch, int side, double p,
                        const SpreadRule& rule, std::mt19937_64& rng) {
    generate_lattice(scratch, side, p, rng);
    return spread_to_quiescence(scratch, rule);
}
