#ifndef FASTPASS_REPORT_HPP
#define FASTPASS_REPORT_HPP

#include <iosfwd>
#include <optional>
#include <string>

#include "fastpass/statistics.hpp"
#include "fastpass/sweep.hpp"

namespace fastpass {

// "N/A" for an undefined mean
std::string format_minutes(const std::optional<double>& minutes, int precision = 2);

void print_run_summary(std::ostream& out, const RunConfig& config, const RunResult& result);

// recommended fraction per arrival rate
void print_recommendations(std::ostream& out, const SweepResult& sweep);

// fraction -> both means, one block per arrival rate
void print_sweep_table(std::ostream& out, const SweepResult& sweep);

/* -------------------------
CSV writers; throw std::runtime_error if the file cannot be written
------------------------- */
void write_csv_sweep(std::ostream& out, const SweepResult& sweep);
void write_csv_sweep(const std::string& path, const SweepResult& sweep);

void write_csv_per_run(std::ostream& out, const SweepResult& sweep);
void write_csv_per_run(const std::string& path, const SweepResult& sweep);

} // namespace fastpass

#endif // FASTPASS_REPORT_HPP
