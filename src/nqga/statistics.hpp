
#pragma once

#include "population.hpp"

#include <numeric>
#include <vector>

namespace nqga {
namespace stats {

  template<chromosome Chromosome, fitness_value Fitness>
  struct generation_record {
    using chromosome_t = Chromosome;
    using fitness_t = Fitness;

    std::size_t generation;
    bool solved;
    chromosome_t best;
    fitness_t best_fitness;
    double accuracy;

    fitness_t worst_fitness;
    double average_fitness;
  };

  // percentage of the target reached by the best individual
  template<fitness_value Fitness>
  inline double accuracy(Fitness const& best, Fitness const& target) noexcept {
    if (target == Fitness{}) {
      return 100.;
    }

    return static_cast<double>(best) / static_cast<double>(target) * 100.;
  }

  template<fitness_value Fitness>
  inline double average(std::vector<Fitness> const& scores) noexcept {
    if (scores.empty()) {
      return 0.;
    }

    auto total = std::accumulate(scores.begin(), scores.end(), 0.);
    return total / static_cast<double>(scores.size());
  }

  // expects a population ranked from best to worst with aligned scores
  template<chromosome Chromosome, fitness_value Fitness>
  auto make_record(std::size_t generation,
                   population<Chromosome> const& ranked,
                   std::vector<Fitness> const& scores,
                   Fitness const& target) {
    return generation_record<Chromosome, Fitness>{
        .generation = generation,
        .solved = scores.front() == target,
        .best = ranked[0],
        .best_fitness = scores.front(),
        .accuracy = accuracy(scores.front(), target),
        .worst_fitness = scores.back(),
        .average_fitness = average(scores)};
  }

  template<chromosome Chromosome, fitness_value Fitness>
  class history {
  public:
    using chromosome_t = Chromosome;
    using fitness_t = Fitness;
    using record_t = generation_record<chromosome_t, fitness_t>;
    using collection_t = std::vector<record_t>;

  public:
    inline auto& push(record_t record) {
      return records_.emplace_back(std::move(record));
    }

    // expects at least one record
    inline auto const& current() const noexcept {
      return records_.back();
    }

    // expects at least two records
    inline auto const& previous() const {
      return *(records_.rbegin() + 1);
    }

    inline auto const& records() const noexcept {
      return records_;
    }

    inline auto begin() const noexcept {
      return records_.begin();
    }

    inline auto end() const noexcept {
      return records_.end();
    }

    inline std::size_t size() const noexcept {
      return records_.size();
    }

    inline bool empty() const noexcept {
      return records_.empty();
    }

  private:
    collection_t records_;
  };

} // namespace stats
} // namespace nqga
