
#pragma once

#include "nqga.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <string>

namespace nqueens {

inline std::string format_accuracy(double accuracy) {
  return fmt::format("{:.3f}%", accuracy);
}

// one line per row, top row first
inline std::string render_board(nqga::genome_t const& genome) {
  auto size = static_cast<nqga::gene_t>(genome.size());

  std::string board;
  for (nqga::gene_t row = 0; row < size; ++row) {
    for (auto queen : genome) {
      board += queen == row ? " Q " : " * ";
    }
    board += '\n';
  }

  return board;
}

inline std::string history_header() {
  return fmt::format("{:>10} | {:^6} | {:<40} | {:>7} | {:>8}\n{:-<85}\n",
                     "Generation",
                     "Solved",
                     "Best genome",
                     "Fitness",
                     "Accuracy",
                     "");
}

template<typename Record>
inline std::string history_row(Record const& record) {
  return fmt::format("{:>10} | {:^6} | {:<40} | {:>7} | {:>8}\n",
                     record.generation,
                     record.solved,
                     fmt::format("{}", record.best),
                     record.best_fitness,
                     format_accuracy(record.accuracy));
}

} // namespace nqueens
