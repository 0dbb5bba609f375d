
#pragma once

#include "fitness.hpp"

#include <functional>
#include <random>
#include <stdexcept>
#include <utility>

namespace nqga {

template<typename Operation>
concept initializator = std::is_invocable_v<Operation> &&
                        chromosome<std::invoke_result_t<Operation>>;

template<typename Operation, typename Chromosome>
concept evaluator =
    std::is_invocable_v<
        Operation,
        std::add_lvalue_reference_t<std::add_const_t<Chromosome>>> &&
    fitness_value<std::invoke_result_t<
        Operation,
        std::add_lvalue_reference_t<std::add_const_t<Chromosome>>>>;

template<chromosome Chromosome, evaluator<Chromosome> Evaluator>
using get_evaluator_result_t = std::invoke_result_t<
    Evaluator,
    std::add_lvalue_reference_t<std::add_const_t<Chromosome>>>;

template<typename Operation, typename Chromosome>
concept crossover_operation = std::is_invocable_r_v<
    std::pair<Chromosome, Chromosome>,
    Operation,
    std::add_lvalue_reference_t<std::add_const_t<Chromosome>>,
    std::add_lvalue_reference_t<std::add_const_t<Chromosome>>>;

template<typename Operation, typename Chromosome>
concept mutation_operation =
    std::is_invocable_v<Operation, std::add_lvalue_reference_t<Chromosome>>;

template<typename Range, typename Iterator>
concept parents_pair = requires(Range parents) {
  { std::get<0>(parents) } -> std::convertible_to<Iterator>;
  { std::get<1>(parents) } -> std::convertible_to<Iterator>;
};

template<typename Operation, typename Population, typename Evaluator>
concept selection_operation =
    std::is_invocable_v<
        Operation,
        std::add_lvalue_reference_t<std::add_const_t<Population>>,
        std::add_lvalue_reference_t<std::add_const_t<Evaluator>>> &&
    parents_pair<
        std::invoke_result_t<
            Operation,
            std::add_lvalue_reference_t<std::add_const_t<Population>>,
            std::add_lvalue_reference_t<std::add_const_t<Evaluator>>>,
        typename Population::const_iterator_t>;

template<typename Operation, typename Population, typename History>
concept criterion = std::is_invocable_r_v<
    bool,
    Operation,
    std::add_lvalue_reference_t<std::add_const_t<Population>>,
    std::add_lvalue_reference_t<std::add_const_t<History>>>;

inline double check_probability(double probability) {
  if (!(probability >= 0. && probability <= 1.)) {
    throw std::invalid_argument{"probability must be in range [0, 1]"};
  }

  return probability;
}

template<typename Generator>
class probabilistic_operation {
public:
  using generator_t = Generator;
  using distribution_t = std::uniform_real_distribution<double>;

public:
  inline probabilistic_operation(generator_t& generator, double probability)
      : generator_{&generator}
      , probability_{check_probability(probability)} {
  }

  inline bool operator()() const {
    if (probability_ == 0.) {
      return false;
    }
    else if (probability_ == 1.) {
      return true;
    }

    return distribution_t{0., 1.}(*generator_) < probability_;
  }

  inline double probability() const noexcept {
    return probability_;
  }

private:
  generator_t* generator_;
  double probability_;
};

} // namespace nqga
