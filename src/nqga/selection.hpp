
#pragma once

#include "population.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

namespace nqga {
namespace select {

  namespace details {

    template<typename Weight>
    concept wheel_weight = fitness_value<Weight> && std::integral<Weight>;

    // cumulative weights, one slot per individual
    template<std::ranges::range Range, typename Weigh>
    auto generate_wheel(Range const& range, Weigh&& weigh) {
      using weight_t = std::invoke_result_t<
          Weigh,
          std::add_lvalue_reference_t<
              std::add_const_t<std::ranges::range_value_t<Range>>>>;

      std::vector<weight_t> wheel;
      wheel.reserve(std::ranges::size(range));

      weight_t total{};
      for (auto&& item : range) {
        auto weight = std::invoke(weigh, item);
        if (weight < weight_t{}) {
          throw std::invalid_argument{
              "roulette selection requires non-negative fitness"};
        }

        total += weight;
        wheel.push_back(total);
      }

      if (wheel.empty() || wheel.back() == weight_t{}) {
        throw std::invalid_argument{
            "roulette selection requires at least one positive fitness"};
      }

      return wheel;
    }

    // individuals with zero weight occupy an empty slice and are never hit
    template<wheel_weight Weight, typename Generator>
    inline std::size_t roll_wheel(std::vector<Weight> const& wheel,
                                  Generator& generator) {
      auto selected =
          std::uniform_int_distribution<Weight>{0, wheel.back() - 1}(generator);

      return static_cast<std::size_t>(
          std::ranges::upper_bound(wheel, selected) - wheel.begin());
    }

  } // namespace details

  // fitness-proportionate sampling with replacement
  template<typename Generator>
  class roulette {
  public:
    using generator_t = Generator;

  public:
    inline explicit roulette(generator_t& generator) noexcept
        : generator_{&generator} {
    }

    template<typename Population,
             evaluator<typename Population::chromosome_t> Evaluator>
      requires details::wheel_weight<
          get_evaluator_result_t<typename Population::chromosome_t, Evaluator>>
    auto operator()(Population const& population,
                    Evaluator const& evaluate) const {
      auto wheel =
          details::generate_wheel(population.individuals(), [&evaluate](auto& c) {
            return std::invoke(evaluate, c);
          });

      auto first = population.individuals().begin();
      auto left = details::roll_wheel(wheel, *generator_);
      auto right = details::roll_wheel(wheel, *generator_);

      return std::pair{first + static_cast<std::ptrdiff_t>(left),
                       first + static_cast<std::ptrdiff_t>(right)};
    }

  private:
    generator_t* generator_;
  };

} // namespace select
} // namespace nqga
