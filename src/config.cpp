#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "aggregate.hpp"
#include "lattice.hpp"

namespace {

std::invalid_argument bad_value(const std::string& name, const std::string& value,
                                const std::string& why) {
    return std::invalid_argument("invalid value '" + value + "' for " + name + ": " + why);
}

long long parse_integer(const std::string& name, const std::string& value) {
    std::size_t pos = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &pos);
    } catch (const std::logic_error&) {
        throw bad_value(name, value, "not an integer");
    }
    if (pos != value.size()) {
        throw bad_value(name, value, "not an integer");
    }
    return v;
}

std::uint64_t parse_unsigned(const std::string& name, const std::string& value) {
    // stoull would skip whitespace and wrap a '-' sign around
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        throw bad_value(name, value, "must be a non-negative integer");
    }
    std::size_t pos = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(value, &pos);
    } catch (const std::logic_error&) {
        throw bad_value(name, value, "not an integer");
    }
    if (pos != value.size()) {
        throw bad_value(name, value, "not an integer");
    }
    return static_cast<std::uint64_t>(v);
}

double parse_real(const std::string& name, const std::string& value) {
    std::size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &pos);
    } catch (const std::logic_error&) {
        throw bad_value(name, value, "not a number");
    }
    if (pos != value.size() || !std::isfinite(v)) {
        throw bad_value(name, value, "not a number");
    }
    return v;
}

bool looks_like_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-' &&
           !std::isdigit(static_cast<unsigned char>(arg[1])) && arg[1] != '.';
}

} // namespace

std::vector<double> make_probabilities(int resolution, double p_min, double p_max) {
    if (resolution < 1) {
        throw std::invalid_argument("resolution must be positive");
    }
    std::vector<double> ps;
    ps.reserve(resolution + 1);
    const double span = p_max - p_min;
    for (int i = 0; i <= resolution; ++i) {
        ps.push_back(p_min + span * static_cast<double>(i) / resolution);
    }
    // Pin the last point so floating error never leaves [p_min, p_max]
    ps.back() = p_max;
    return ps;
}

void validate_config(const SweepConfig& config) {
    check_side(config.side);
    check_sample_count(config.sample_count);

    if (config.resolution < MIN_RESOLUTION) {
        throw std::invalid_argument("resolution must be higher than 2, got " +
                                    std::to_string(config.resolution));
    }
    check_probability(config.p_min);
    check_probability(config.p_max);
    if (!(config.p_min < config.p_max)) {
        throw std::invalid_argument("--pmin must be smaller than --pmax");
    }
    if (config.probabilities.empty()) {
        throw std::invalid_argument("empty probability sweep");
    }
    for (std::size_t k = 1; k < config.probabilities.size(); ++k) {
        if (!(config.probabilities[k - 1] < config.probabilities[k])) {
            throw std::invalid_argument("probability sweep is not strictly ascending");
        }
    }
}

ParseResult parse_args(const std::vector<std::string>& args) {
    ParseResult result;
    SweepConfig& cfg = result.config;
    bool side_set = false;

    const std::size_t n = args.size();
    auto value_of = [&](std::size_t& i, const std::string& name) -> const std::string& {
        if (i + 1 >= n) {
            throw std::invalid_argument("missing value for " + name);
        }
        return args[++i];
    };

    for (std::size_t i = 0; i < n; ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            result.help = true;
            return result;
        } else if (arg == "-s" || arg == "--sample") {
            cfg.sample_count = parse_unsigned(arg, value_of(i, arg));
            if (cfg.sample_count == 0) {
                throw std::invalid_argument("invalid value '0' for " + arg + ": sample count must be positive");
            }
        } else if (arg == "-r" || arg == "--resolution") {
            const std::string& v = value_of(i, arg);
            long long r = parse_integer(arg, v);
            if (r < MIN_RESOLUTION || r > 100000000LL) {
                throw bad_value(arg, v, "the resolution must be higher than 2");
            }
            cfg.resolution = static_cast<int>(r);
        } else if (arg == "--pmin") {
            cfg.p_min = parse_real(arg, value_of(i, arg));
        } else if (arg == "--pmax") {
            cfg.p_max = parse_real(arg, value_of(i, arg));
        } else if (arg == "--seed") {
            cfg.seed = parse_unsigned(arg, value_of(i, arg));
            cfg.seed_given = true;
        } else if (arg == "--neighborhood") {
            const std::string& v = value_of(i, arg);
            if (v == "4") {
                cfg.rule.neighborhood = Neighborhood::VonNeumann;
            } else if (v == "8") {
                cfg.rule.neighborhood = Neighborhood::Moore;
            } else {
                throw bad_value(arg, v, "expected 4 or 8");
            }
        } else if (arg == "--boundary") {
            const std::string& v = value_of(i, arg);
            if (v == "open") {
                cfg.rule.boundary = Boundary::Open;
            } else if (v == "periodic") {
                cfg.rule.boundary = Boundary::Periodic;
            } else {
                throw bad_value(arg, v, "expected open or periodic");
            }
        } else if (arg == "--edge") {
            const std::string& v = value_of(i, arg);
            if (v == "left") {
                cfg.rule.edge = IgnitionEdge::Left;
            } else if (v == "top") {
                cfg.rule.edge = IgnitionEdge::Top;
            } else {
                throw bad_value(arg, v, "expected left or top");
            }
        } else if (arg == "--stats") {
            cfg.print_stats = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (looks_like_option(arg)) {
            throw std::invalid_argument("unknown argument: " + arg);
        } else if (!side_set) {
            long long side = parse_integer("N", arg);
            if (side <= 0 || side > 1000000LL) {
                throw bad_value("N", arg, "lattice side must be a positive integer");
            }
            cfg.side = static_cast<int>(side);
            side_set = true;
        } else {
            throw std::invalid_argument("unexpected extra argument: " + arg);
        }
    }

    if (!side_set) {
        throw std::invalid_argument("missing lattice side N");
    }

    check_probability(cfg.p_min);
    check_probability(cfg.p_max);
    if (!(cfg.p_min < cfg.p_max)) {
        throw std::invalid_argument("--pmin must be smaller than --pmax");
    }
    cfg.probabilities = make_probabilities(cfg.resolution, cfg.p_min, cfg.p_max);

    validate_config(cfg);
    return result;
}

void print_usage(std::ostream& os, const std::string& prog) {
    os << "Usage: " << prog << " <N> [options]\n"
       << "  N                      lattice side length\n"
       << "  -s, --sample <n>       trials per probability point (default "
       << DEFAULT_SAMPLE_COUNT << ")\n"
       << "  -r, --resolution <n>   probability intervals in [pmin, pmax], > 2 (default "
       << DEFAULT_RESOLUTION << ")\n"
       << "      --pmin <p>         lowest probability (default 0)\n"
       << "      --pmax <p>         highest probability (default 1)\n"
       << "      --seed <u64>       base random seed (default: random)\n"
       << "      --neighborhood 4|8 spreading connectivity (default 4)\n"
       << "      --boundary open|periodic (default open)\n"
       << "      --edge left|top    ignition edge (default left)\n"
       << "      --stats            append variance and standard error columns\n"
       << "  -v, --verbose          process layout, parameters and timing on stderr\n"
       << "  -h, --help             show this help\n";
}
