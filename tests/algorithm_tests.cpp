#include "random.hpp"

#include <nqga.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace tests::algorithm {

// records population size of every ranked generation
struct size_tracker {
  std::vector<std::size_t>* sizes_;

  template<typename Population, typename History>
  inline void operator()(Population const& population,
                         History const& /*unused*/) const {
    sizes_->push_back(population.current_size());
  }
};

inline auto track_sizes(std::vector<std::size_t>& sizes) {
  return nqga::observe{nqga::generation_event, size_tracker{&sizes}};
}

TEST(algorithm_tests, single_generation) {
  // act
  auto result = nqga::run_evolution(50, 4, 1);

  // assert
  EXPECT_EQ(result.history.size(), 1u);
  EXPECT_EQ(result.generation, 1u);
  EXPECT_EQ(result.population.current_size(), 50u);
}

TEST(algorithm_tests, generation_limit_zero) {
  // act
  auto result = nqga::run_evolution(10, 8, 0);

  // assert
  EXPECT_TRUE(result.history.empty());
  EXPECT_EQ(result.generation, 0u);
  EXPECT_EQ(result.population.current_size(), 10u);
}

TEST(algorithm_tests, runs_to_limit) {
  // act
  auto result = nqga::run_evolution(30, 25, 5);

  // assert
  EXPECT_EQ(result.history.size(), 5u);
  EXPECT_EQ(result.generation, 5u);

  for (std::size_t i = 0; i < result.history.size(); ++i) {
    EXPECT_EQ(result.history.records()[i].generation, i);
  }
}

TEST(algorithm_tests, single_solves_four) {
  for (auto seed : seeds) {
    // act
    auto result = nqga::run_evolution(50, 4, 100, 2, true, seed);

    // assert
    ASSERT_FALSE(result.history.empty());

    auto const& last = result.history.current();
    EXPECT_TRUE(last.solved) << "seed " << seed;
    EXPECT_EQ(last.best_fitness, 6);
    EXPECT_DOUBLE_EQ(last.accuracy, 100.);
    EXPECT_EQ(result.generation + 1, result.history.size());

    auto const& records = result.history.records();
    for (std::size_t i = 0; i + 1 < records.size(); ++i) {
      EXPECT_FALSE(records[i].solved) << "seed " << seed << " record " << i;
    }

    EXPECT_THAT(result.population[0],
                ::testing::AnyOf(::testing::ElementsAre(1, 3, 0, 2),
                                 ::testing::ElementsAre(2, 0, 3, 1)));
    EXPECT_EQ(nqga::fitness(result.population[0]), 6);
  }
}

TEST(algorithm_tests, single_stops_at_first_solved) {
  for (auto seed : seeds) {
    // act
    auto result = nqga::run_evolution(50, 5, 100, 2, true, seed);

    // assert
    auto solved = std::ranges::count_if(
        result.history, [](auto const& record) { return record.solved; });

    EXPECT_EQ(solved, 1) << "seed " << seed;
    EXPECT_TRUE(result.history.current().solved) << "seed " << seed;
  }
}

TEST(algorithm_tests, non_single_continues_after_solve) {
  // act
  auto result = nqga::run_evolution(50, 4, 20, 2, false, 42);

  // assert
  EXPECT_EQ(result.history.size(), 20u);
  EXPECT_EQ(result.generation, 20u);

  auto solved = std::ranges::count_if(
      result.history, [](auto const& record) { return record.solved; });

  EXPECT_GT(solved, 1);
}

TEST(algorithm_tests, single_unbounded) {
  // act
  auto result = nqga::run_evolution(50, 4, -1, 2, true, seeds[2]);

  // assert
  EXPECT_TRUE(result.history.current().solved);
}

TEST(algorithm_tests, history_consistent) {
  // act
  auto result = nqga::run_evolution(20, 8, 10, 2, false, seeds[1]);

  // assert
  for (auto const& record : result.history) {
    EXPECT_LE(record.worst_fitness, record.best_fitness);
    EXPECT_GE(record.average_fitness,
              static_cast<double>(record.worst_fitness));
    EXPECT_LE(record.average_fitness, static_cast<double>(record.best_fitness));
    EXPECT_EQ(nqga::fitness(record.best), record.best_fitness);
    EXPECT_EQ(record.solved, record.best_fitness == nqga::max_fitness(8));
  }
}

TEST(algorithm_tests, elites_survive) {
  // act
  auto result = nqga::run_evolution(20, 8, 15, 2, false, seeds[3]);

  // assert
  for (auto it = result.history.begin() + 1; it != result.history.end(); ++it) {
    EXPECT_GE(it->best_fitness, (it - 1)->best_fitness);
  }
}

TEST(algorithm_tests, reproducible) {
  // act
  auto result1 = nqga::run_evolution(20, 8, 10, 2, false, seeds[4]);
  auto result2 = nqga::run_evolution(20, 8, 10, 2, false, seeds[4]);

  // assert
  ASSERT_EQ(result1.history.size(), result2.history.size());
  for (std::size_t i = 0; i < result1.history.size(); ++i) {
    EXPECT_EQ(result1.history.records()[i].best,
              result2.history.records()[i].best);
  }

  EXPECT_EQ(result1.population.individuals(), result2.population.individuals());
}

TEST(algorithm_tests, zero_population) {
  EXPECT_THROW(nqga::run_evolution(0, 4), std::invalid_argument);
}

// population size and survivals
using fill_param_t = std::pair<std::size_t, std::size_t>;

class fill_tests : public ::testing::TestWithParam<fill_param_t> {};

TEST_P(fill_tests, exact_keeps_size) {
  // arrange
  auto [size, survivals] = GetParam();

  nqga::settings settings{.population_size = size,
                          .queens = 8,
                          .generation_limit = 6,
                          .survivals = survivals};

  generator_t rng{seeds[0]};
  std::vector<std::size_t> sizes;

  // act
  auto result = nqga::run_evolution(settings, rng, track_sizes(sizes));

  // assert
  EXPECT_THAT(sizes, ::testing::SizeIs(6));
  EXPECT_THAT(sizes, ::testing::Each(size));
  EXPECT_EQ(result.population.current_size(), size);
}

INSTANTIATE_TEST_SUITE_P(algorithm_tests,
                         fill_tests,
                         ::testing::Values(fill_param_t{10, 2},
                                           fill_param_t{11, 2},
                                           fill_param_t{7, 3},
                                           fill_param_t{5, 12},
                                           fill_param_t{1, 0}));

TEST(algorithm_tests, legacy_drift) {
  // arrange
  nqga::settings settings{.population_size = 20,
                          .queens = 8,
                          .generation_limit = 4,
                          .survivals = 1,
                          .fill = nqga::fill_policy::legacy};

  generator_t rng{seeds[0]};
  std::vector<std::size_t> sizes;

  // act
  auto result = nqga::run_evolution(settings, rng, track_sizes(sizes));

  // assert
  EXPECT_THAT(sizes, ::testing::ElementsAre(20, 19, 17, 15));
  EXPECT_EQ(result.population.current_size(), 13u);
}

TEST(algorithm_tests, legacy_empty_generation) {
  // arrange
  nqga::settings settings{.population_size = 3,
                          .queens = 8,
                          .generation_limit = 5,
                          .survivals = 0,
                          .fill = nqga::fill_policy::legacy};

  generator_t rng{seeds[0]};

  // act & assert
  EXPECT_THROW(nqga::run_evolution(settings, rng), std::logic_error);
}

TEST(algorithm_tests, observer_per_generation) {
  // arrange
  nqga::settings settings{.population_size = 16,
                          .queens = 6,
                          .generation_limit = 7};

  generator_t rng{seeds[1]};
  std::vector<std::size_t> generations;

  auto observer = nqga::observe{
      nqga::generation_event,
      [&generations](auto const& /*unused*/, auto const& history) {
        generations.push_back(history.current().generation);
      }};

  // act
  auto result = nqga::run_evolution(settings, rng, observer);

  // assert
  EXPECT_THAT(generations, ::testing::ElementsAre(0, 1, 2, 3, 4, 5, 6));
  EXPECT_EQ(result.history.size(), 7u);
}

TEST(algorithm_tests, custom_stop) {
  // arrange
  nqga::settings settings{.population_size = 50, .queens = 5};
  generator_t rng{seeds[2]};

  nqga::algo algo{nqga::start_config(settings, rng)
                      .stop(nqga::criteria::solved{})
                      .build()};

  // act
  auto result = algo.run();

  // assert
  EXPECT_TRUE(result.history.current().solved);
  EXPECT_EQ(result.generation, result.history.size());
}

} // namespace tests::algorithm
