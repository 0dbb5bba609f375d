
#pragma once

#include <cstdint>
#include <cstdlib>
#include <type_traits>
#include <unordered_set>

#include "chromosome.hpp"

namespace nqga {

template<typename Type>
concept fitness_value =
    std::regular<Type> && std::totally_ordered<Type> &&
    std::is_nothrow_move_constructible_v<Type> &&
    std::is_nothrow_move_assignable_v<Type>;

using fitness_t = std::int64_t;

// number of unordered queen pairs, score of a board without conflicts
inline constexpr fitness_t max_fitness(std::size_t queens) noexcept {
  return queens < 2 ? 0 : static_cast<fitness_t>(queens * (queens - 1) / 2);
}

struct conflicts {
  std::size_t rows{};
  std::size_t diagonals{};

  inline constexpr std::size_t total() const noexcept {
    return rows + diagonals;
  }

  friend bool operator==(conflicts const&, conflicts const&) = default;
};

namespace details {

  // each value that occurs k times contributes k - 1 row conflicts
  template<board_chromosome Chromosome>
  inline std::size_t count_rows(Chromosome const& genome) {
    std::unordered_set<std::ranges::range_value_t<Chromosome>> distinct{
        std::ranges::begin(genome), std::ranges::end(genome)};

    return std::ranges::size(genome) - distinct.size();
  }

  template<board_chromosome Chromosome>
  std::size_t count_diagonals(Chromosome const& genome) {
    auto size = std::ranges::size(genome);

    std::size_t count{};
    for (std::size_t i = 0; i + 1 < size; ++i) {
      for (auto j = i + 1; j < size; ++j) {
        auto dy = static_cast<fitness_t>(genome[i]) -
                  static_cast<fitness_t>(genome[j]);

        if (static_cast<fitness_t>(j - i) == std::abs(dy)) {
          ++count;
        }
      }
    }

    return count;
  }

} // namespace details

template<board_chromosome Chromosome>
inline conflicts count_conflicts(Chromosome const& genome) {
  return {details::count_rows(genome), details::count_diagonals(genome)};
}

// columns cannot conflict: the representation places one queen per column
struct queens_fitness {
  template<board_chromosome Chromosome>
  inline fitness_t operator()(Chromosome const& genome) const {
    return max_fitness(std::ranges::size(genome)) -
           static_cast<fitness_t>(count_conflicts(genome).total());
  }
};

} // namespace nqga
