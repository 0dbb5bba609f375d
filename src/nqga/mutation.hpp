
#pragma once

#include "operation.hpp"

#include <random>

namespace nqga::mutate {

namespace details {

  template<typename Generator, range_chromosome Chromosome>
  inline auto select(Generator& generator, Chromosome const& chromosome) {
    return std::uniform_int_distribution<std::size_t>{
        0, std::ranges::size(chromosome) - 1}(generator);
  }

  template<typename Generator, board_chromosome Chromosome>
  inline auto roll(Generator& generator, Chromosome const& chromosome) {
    using value_t = std::ranges::range_value_t<Chromosome>;
    return std::uniform_int_distribution<value_t>{
        0, static_cast<value_t>(std::ranges::size(chromosome)) - 1}(generator);
  }

} // namespace details

// overwrites one randomly chosen gene with a random row; the new row can be
// equal to the old one
template<typename Generator>
class replace_gene {
public:
  using generator_t = Generator;

  inline static constexpr double default_probability = 0.5;

public:
  inline explicit replace_gene(generator_t& generator,
                               double probability = default_probability)
      : generator_{&generator}
      , mutate_{generator, probability} {
  }

  template<board_chromosome Chromosome>
  Chromosome& operator()(Chromosome& target) const {
    if (mutate_() && !std::ranges::empty(target)) {
      auto idx = details::select(*generator_, target);
      target[idx] = details::roll(*generator_, target);
    }

    return target;
  }

  inline double probability() const noexcept {
    return mutate_.probability();
  }

private:
  generator_t* generator_;
  probabilistic_operation<generator_t> mutate_;
};

} // namespace nqga::mutate
