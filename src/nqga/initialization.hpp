
#pragma once

#include "population.hpp"

#include <algorithm>
#include <random>

namespace nqga::init {

template<typename Generator>
class random_board {
public:
  using generator_t = Generator;
  using distribution_t = std::uniform_int_distribution<gene_t>;

public:
  inline random_board(generator_t& generator, std::size_t queens) noexcept
      : generator_{&generator}
      , queens_{queens} {
  }

  inline genome_t operator()() const {
    genome_t genome{};
    if (queens_ == 0) {
      return genome;
    }

    distribution_t dist{0, static_cast<gene_t>(queens_) - 1};
    std::ranges::generate_n(draft(genome, queens_),
                            static_cast<std::ptrdiff_t>(queens_),
                            [&dist, this] { return dist(*generator_); });

    return genome;
  }

  inline std::size_t queens() const noexcept {
    return queens_;
  }

private:
  generator_t* generator_;
  std::size_t queens_;
};

template<initializator Initializator>
auto generate(std::size_t size, Initializator const& initializator) {
  using chromosome_t = std::invoke_result_t<Initializator const&>;

  population<chromosome_t> result{size};
  for (auto i = size; i > 0; --i) {
    result.push_back(std::invoke(initializator));
  }

  return result;
}

} // namespace nqga::init
