
#pragma once

#include "algorithm.hpp"
#include "criteria.hpp"
#include "crossover.hpp"
#include "initialization.hpp"
#include "mutation.hpp"
#include "observing.hpp"
#include "selection.hpp"
#include "statistics.hpp"

#include <random>

namespace nqga {

using default_generator_t = std::mt19937;

inline fitness_t fitness(genome_t const& genome) {
  return queens_fitness{}(genome);
}

template<typename Generator>
inline auto generate_population(std::size_t size,
                                std::size_t queens,
                                Generator& generator) {
  return init::generate(size, init::random_board{generator, queens});
}

template<typename Generator>
inline auto crossover(genome_t const& left,
                      genome_t const& right,
                      Generator& generator) {
  return cross::symmetric_singlepoint{generator}(left, right);
}

template<typename Generator>
inline genome_t& mutation(genome_t& genome,
                          Generator& generator,
                          double probability = 0.5) {
  return mutate::replace_gene{generator, probability}(genome);
}

template<typename Population,
         evaluator<typename Population::chromosome_t> Evaluator,
         typename Generator>
inline auto selection(Population const& population,
                      Evaluator const& evaluate,
                      Generator& generator) {
  return select::roulette{generator}(population, evaluate);
}

template<typename Generator>
inline auto start_config(settings const& options, Generator& generator) {
  return config::builder<>{options}
      .spawn(init::random_board{generator, options.queens})
      .evaluate(queens_fitness{})
      .select(select::roulette{generator})
      .reproduce(cross::symmetric_singlepoint{generator},
                 mutate::replace_gene{generator, options.mutation_probability});
}

namespace details {

  template<typename Builder>
  inline auto attach(Builder const& builder) {
    return builder;
  }

  template<typename Builder, typename Observe, typename... Observes>
  inline auto attach(Builder const& builder,
                     Observe const& observe,
                     Observes const&... rest) {
    return attach(builder.observe(observe), rest...);
  }

} // namespace details

template<typename Generator, typename... Observes>
inline auto make_default_config(settings const& options,
                                Generator& generator,
                                Observes const&... observes) {
  return details::attach(start_config(options, generator), observes...)
      .build();
}

template<typename Generator, typename... Observes>
inline auto run_evolution(settings const& options,
                          Generator& generator,
                          Observes const&... observes) {
  return algo{make_default_config(options, generator, observes...)}.run();
}

inline auto run_evolution(
    std::size_t population_size,
    std::size_t queens_total,
    std::int64_t generation_limit = 100,
    std::size_t survivals = 2,
    bool single = false,
    default_generator_t::result_type seed = default_generator_t::default_seed) {
  default_generator_t generator{seed};

  return run_evolution(settings{.population_size = population_size,
                                .queens = queens_total,
                                .generation_limit = generation_limit,
                                .survivals = survivals,
                                .single = single},
                       generator);
}

} // namespace nqga
