
#pragma once

#include "configuration.hpp"
#include "initialization.hpp"

#include <algorithm>
#include <stdexcept>

namespace nqga {

template<typename Config>
concept algo_config = requires(Config c) {
  requires chromosome<typename Config::chromosome_t>;
  requires fitness_value<typename Config::fitness_t>;

  requires initializator<typename Config::initializator_t>;
  requires evaluator<typename Config::evaluator_t,
                     typename Config::chromosome_t>;
  requires selection_operation<typename Config::selection_t,
                               population<typename Config::chromosome_t>,
                               typename Config::evaluator_t>;
  requires crossover_operation<typename Config::crossover_t,
                               typename Config::chromosome_t>;
  requires mutation_operation<typename Config::mutation_t,
                              typename Config::chromosome_t>;
  requires criterion<
      typename Config::criterion_t,
      population<typename Config::chromosome_t>,
      stats::history<typename Config::chromosome_t, typename Config::fitness_t>>;

  { c.initializator() };
  { c.evaluator() };
  { c.selection() };
  { c.crossover() };
  { c.mutation() };
  { c.criterion() };
  { c.observers() };

  { c.target_fitness() } -> std::convertible_to<typename Config::fitness_t>;
  { c.population_size() } -> std::convertible_to<std::size_t>;
  { c.survivals() } -> std::convertible_to<std::size_t>;
  { c.single() } -> std::convertible_to<bool>;
  { c.fill() } -> std::same_as<fill_policy>;
};

template<typename Population, typename History>
struct evolution_result {
  Population population;
  std::size_t generation;
  History history;
};

template<algo_config Config>
class algo {
public:
  using config_t = Config;
  using chromosome_t = typename config_t::chromosome_t;
  using fitness_t = typename config_t::fitness_t;

  using population_t = population<chromosome_t>;
  using history_t = stats::history<chromosome_t, fitness_t>;
  using result_t = evolution_result<population_t, history_t>;

public:
  inline explicit algo(config_t const& config)
      : config_{config} {
    if (config_.population_size() == 0) {
      throw std::invalid_argument{"population size must be positive"};
    }
  }

  result_t run() {
    auto current = init::generate(config_.population_size(),
                                  config_.initializator());
    history_t history{};

    std::size_t generation = 0;
    while (!std::invoke(config_.criterion(), current, history)) {
      // legacy fill without survivals can breed nothing for tiny populations
      if (current.empty()) {
        throw std::logic_error{"generation has no individuals"};
      }

      auto scores = current.sort(config_.evaluator());

      history.push(stats::make_record(
          generation, current, scores, config_.target_fitness()));

      config_.observers().notify(generation_event, current, history);

      if (config_.single() && criteria::solved{}(current, history)) {
        break;
      }

      current = reproduce(current);
      ++generation;
    }

    return {std::move(current), generation, std::move(history)};
  }

private:
  // expects current population to be ranked
  population_t reproduce(population_t const& current) {
    auto target = config_.population_size();
    auto elites = std::min(config_.survivals(), current.current_size());

    if (config_.fill() == fill_policy::exact) {
      elites = std::min(elites, target);
    }

    population_t next{target};
    next.insert(std::views::take(current.individuals(),
                                 static_cast<std::ptrdiff_t>(elites)));

    if (config_.fill() == fill_policy::exact) {
      while (!next.full()) {
        auto [child1, child2] = breed(current);

        next.push_back(std::move(child1));
        if (!next.full()) {
          next.push_back(std::move(child2));
        }
      }
    }
    else {
      auto half = current.current_size() / 2;
      for (auto i = half > 0 ? half - 1 : 0; i > 0; --i) {
        auto [child1, child2] = breed(current);

        next.push_back(std::move(child1));
        next.push_back(std::move(child2));
      }
    }

    return next;
  }

  inline std::pair<chromosome_t, chromosome_t>
      breed(population_t const& current) {
    auto [parent1, parent2] =
        std::invoke(config_.selection(), current, config_.evaluator());

    auto [child1, child2] =
        std::invoke(config_.crossover(), *parent1, *parent2);

    std::invoke(config_.mutation(), child1);
    std::invoke(config_.mutation(), child2);

    return {std::move(child1), std::move(child2)};
  }

private:
  config_t config_;
};

} // namespace nqga
