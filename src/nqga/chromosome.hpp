
#pragma once

#include <concepts>
#include <iterator>
#include <ranges>
#include <vector>

#include "utility.hpp"

namespace nqga {

// index is the column, value is the row of the queen placed in that column
using gene_t = int;
using genome_t = std::vector<gene_t>;

template<typename Type>
concept chromosome = std::regular<Type>;

template<typename Chromosome>
concept range_chromosome =
    chromosome<Chromosome> && std::ranges::random_access_range<Chromosome> &&
    std::ranges::sized_range<Chromosome>;

template<typename Chromosome>
concept board_chromosome =
    range_chromosome<Chromosome> &&
    std::integral<std::ranges::range_value_t<Chromosome>>;

template<typename... Tys>
inline auto draft(std::vector<Tys...>& target, std::size_t size) {
  target.reserve(size);
  return std::back_inserter(target);
}

} // namespace nqga
