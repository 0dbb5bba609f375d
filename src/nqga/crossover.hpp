
#pragma once

#include "operation.hpp"

#include <algorithm>
#include <random>

namespace nqga {
namespace cross {

  namespace details {

    using distribution_t = std::uniform_int_distribution<std::size_t>;

    template<range_chromosome Chromosome>
    inline auto distribute(Chromosome const& parent1,
                           Chromosome const& parent2) noexcept {
      return distribution_t{
          1,
          std::min(std::ranges::size(parent1), std::ranges::size(parent2)) - 1};
    }

    // dest = left[0, point_left) + right[point_right, end), copied element by
    // element so children never share storage with parents
    template<range_chromosome Chromosome>
    inline void splice(Chromosome& dest,
                       Chromosome const& left,
                       std::size_t point_left,
                       Chromosome const& right,
                       std::size_t point_right) {
      auto size = point_left + std::ranges::size(right) - point_right;

      auto right_it = std::ranges::begin(right);
      std::ranges::advance(right_it, static_cast<std::ptrdiff_t>(point_right));

      std::copy(right_it,
                std::ranges::end(right),
                std::copy_n(std::ranges::begin(left),
                            point_left,
                            draft(dest, size)));
    }

  } // namespace details

  template<typename Generator>
  class symmetric_singlepoint {
  public:
    using generator_t = Generator;

  public:
    inline explicit symmetric_singlepoint(generator_t& generator)
        : generator_{&generator} {
    }

    template<range_chromosome Chromosome>
    inline auto operator()(Chromosome const& p1, Chromosome const& p2) const {
      if (std::min(std::ranges::size(p1), std::ranges::size(p2)) < 2) {
        return std::pair<Chromosome, Chromosome>{p1, p2};
      }

      auto pt = details::distribute(p1, p2)(*generator_);

      std::pair<Chromosome, Chromosome> children{};

      details::splice(children.first, p1, pt, p2, pt);
      details::splice(children.second, p2, pt, p1, pt);

      return children;
    }

  private:
    generator_t* generator_;
  };

} // namespace cross
} // namespace nqga
