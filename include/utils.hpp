#ifndef UTILS_HPP
#define UTILS_HPP
#include <iostream>
#include <string>
#include <mpi.h>

#include "aggregate.hpp"
#include "config.hpp"

constexpr int P_PRECISION = 4;
constexpr int T_PRECISION = 5;

// "<p>\t<mean>" (+ "\t<variance>\t<stderr>" with stats), no newline.
std::string format_row(const Aggregate& a, bool with_stats);

// Write one row and flush it, so a killed run leaves whole lines only.
void write_row(std::ostream& out, const Aggregate& a, bool with_stats);

// Diagnostics go to stderr from rank 0; stdout carries rows only.
// log_process_layout is collective over `comm`.
void log_process_layout(MPI_Comm comm);
void log_run_parameters(const SweepConfig& config, int ranks);
void log_timing(double seconds, std::size_t points);

#endif // UTILS_HPP
