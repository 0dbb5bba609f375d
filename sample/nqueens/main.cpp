#include "nqga.hpp"
#include "report.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <ctime>
#include <exception>
#include <iostream>
#include <random>

namespace {

inline constexpr std::size_t min_queens = 4;
inline constexpr std::size_t max_queens = 25;

inline constexpr std::size_t iterations = 1;

struct log_generation {
  template<typename Population, typename History>
  inline void operator()(Population const& /*unused*/,
                         History const& history) const {
    auto const& record = history.current();
    spdlog::debug("generation {}: best {} worst {} average {:.2f}",
                  record.generation,
                  record.best_fitness,
                  record.worst_fitness,
                  record.average_fitness);
  }
};

} // namespace

int main() {
  spdlog::cfg::load_env_levels();

  try {
    std::size_t queens{};
    fmt::print("Enter the number of queens: ");
    std::fflush(stdout);

    if (!(std::cin >> queens) || queens < min_queens || queens > max_queens) {
      fmt::print("\nInvalid option.\n");
      return 1;
    }

    nqga::settings options{.population_size = 50,
                           .queens = queens,
                           .generation_limit = 100,
                           .survivals = 2,
                           .single = true};

    auto seed = std::random_device{}();
    nqga::default_generator_t generator{seed};

    spdlog::info("searching {} queens: population {}, limit {}, survivals {}, "
                 "seed {}",
                 options.queens,
                 options.population_size,
                 options.generation_limit,
                 options.survivals,
                 seed);

    for (std::size_t i = 0; i < iterations; ++i) {
      auto start = std::clock();

      auto [population, generations, history] = nqga::run_evolution(
          options,
          generator,
          nqga::observe{nqga::generation_event, log_generation{}});

      auto elapsed = static_cast<double>(std::clock() - start) / CLOCKS_PER_SEC;

      auto const& best = history.current();
      if (best.solved) {
        spdlog::info("solution found in generation {}", best.generation);
      }
      else {
        spdlog::warn("no solution after {} generations", history.size());
      }

      fmt::print("Iteration: {} | Generations: {} | Time: {}s\n",
                 i,
                 generations,
                 elapsed);
      fmt::print("Best genome: {}\n", population[0]);
      fmt::print("Accuracy: {}\n", nqueens::format_accuracy(best.accuracy));
      fmt::print("{}", nqueens::render_board(population[0]));
      fmt::print("- - - - - - - - - - - - - - - - -\n\n");

      if (i + 1 == iterations) {
        fmt::print("{}", nqueens::history_header());
        for (auto const& record : history) {
          fmt::print("{}", nqueens::history_row(record));
        }
      }
    }
  }
  catch (std::exception const& e) {
    spdlog::error("search failed: {}", e.what());
    return 2;
  }

  return 0;
}
