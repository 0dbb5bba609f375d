
#pragma once

#include "operation.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace nqga {

template<chromosome Chromosome>
class population {
public:
  using chromosome_t = Chromosome;
  using collection_t = std::vector<chromosome_t>;

  using iterator_t = typename collection_t::iterator;
  using const_iterator_t = typename collection_t::const_iterator;

public:
  inline explicit population(std::size_t target_size)
      : target_size_{target_size} {
    individuals_.reserve(target_size_);
  }

  template<std::ranges::range Range>
  inline auto insert(Range&& chromosomes) {
    auto insertion = individuals_.size();

    auto output = std::back_inserter(individuals_);
    std::ranges::copy(std::forward<Range>(chromosomes), output);

    return std::views::drop(individuals_,
                            static_cast<std::ptrdiff_t>(insertion));
  }

  template<util::forward_ref<chromosome_t> C>
  inline void push_back(C&& chromosome) {
    individuals_.push_back(std::forward<C>(chromosome));
  }

  // ranks individuals from best to worst; equally fit individuals keep their
  // relative order, returned scores are aligned with the new order
  template<evaluator<chromosome_t> Evaluator>
  auto sort(Evaluator const& evaluate) {
    using fitness_t = get_evaluator_result_t<chromosome_t, Evaluator>;

    std::vector<fitness_t> scores;
    scores.reserve(individuals_.size());
    for (auto&& individual : individuals_) {
      scores.push_back(std::invoke(evaluate, individual));
    }

    std::vector<std::size_t> order(individuals_.size());
    std::iota(order.begin(), order.end(), std::size_t{});

    std::ranges::stable_sort(
        order, std::ranges::greater{}, [&scores](std::size_t idx) {
          return scores[idx];
        });

    collection_t ranked;
    ranked.reserve(individuals_.size());

    std::vector<fitness_t> ranked_scores;
    ranked_scores.reserve(scores.size());

    for (auto idx : order) {
      ranked.push_back(std::move(individuals_[idx]));
      ranked_scores.push_back(scores[idx]);
    }

    individuals_ = std::move(ranked);
    return ranked_scores;
  }

  inline auto& individuals() noexcept {
    return individuals_;
  }

  inline auto const& individuals() const noexcept {
    return individuals_;
  }

  inline auto& operator[](std::size_t index) noexcept {
    return individuals_[index];
  }

  inline auto const& operator[](std::size_t index) const noexcept {
    return individuals_[index];
  }

  inline std::size_t current_size() const noexcept {
    return individuals_.size();
  }

  inline std::size_t target_size() const noexcept {
    return target_size_;
  }

  inline bool empty() const noexcept {
    return individuals_.empty();
  }

  inline bool full() const noexcept {
    return individuals_.size() >= target_size_;
  }

private:
  std::size_t target_size_;
  collection_t individuals_;
};

} // namespace nqga
