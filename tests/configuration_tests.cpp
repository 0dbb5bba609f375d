#include "random.hpp"

#include <nqga.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace tests::configuration {

struct configuration_tests : public ::testing::Test {
protected:
  nqga::settings settings_{.population_size = 20,
                           .queens = 6,
                           .generation_limit = 30,
                           .survivals = 3,
                           .single = true,
                           .mutation_probability = 0.25,
                           .fill = nqga::fill_policy::legacy};

  generator_t rng_{};
};

TEST(settings_tests, defaults) {
  nqga::settings settings{};

  EXPECT_EQ(settings.population_size, 50u);
  EXPECT_EQ(settings.queens, 8u);
  EXPECT_EQ(settings.generation_limit, 100);
  EXPECT_EQ(settings.survivals, 2u);
  EXPECT_FALSE(settings.single);
  EXPECT_DOUBLE_EQ(settings.mutation_probability, 0.5);
  EXPECT_EQ(settings.fill, nqga::fill_policy::exact);
}

TEST_F(configuration_tests, default_config) {
  // act
  auto config = nqga::make_default_config(settings_, rng_);

  // assert
  EXPECT_EQ(config.population_size(), 20u);
  EXPECT_EQ(config.survivals(), 3u);
  EXPECT_TRUE(config.single());
  EXPECT_EQ(config.fill(), nqga::fill_policy::legacy);
  EXPECT_EQ(config.target_fitness(), 15);
  EXPECT_EQ(config.initializator().queens(), 6u);
  EXPECT_DOUBLE_EQ(config.mutation().probability(), 0.25);
  EXPECT_EQ(config.criterion().limit(), 30);
}

TEST_F(configuration_tests, custom_target) {
  // act
  auto config = nqga::config::builder<>{settings_}
                    .spawn(nqga::init::random_board{rng_, 6})
                    .evaluate(nqga::queens_fitness{}, 10)
                    .select(nqga::select::roulette{rng_})
                    .reproduce(nqga::cross::symmetric_singlepoint{rng_},
                               nqga::mutate::replace_gene{rng_})
                    .build();

  // assert
  EXPECT_EQ(config.target_fitness(), 10);
  EXPECT_DOUBLE_EQ(config.mutation().probability(), 0.5);
}

TEST_F(configuration_tests, custom_criterion) {
  // act
  auto config = nqga::start_config(settings_, rng_)
                    .stop(nqga::criteria::solved{})
                    .build();

  // assert
  using criterion_t = typename decltype(config)::criterion_t;
  EXPECT_TRUE((std::same_as<criterion_t, nqga::criteria::solved>));
}

TEST_F(configuration_tests, observers_attached) {
  // arrange
  std::size_t calls{};

  auto config = nqga::start_config(settings_, rng_)
                    .observe(nqga::observe{nqga::generation_event,
                                           [&calls](auto const&, auto const&) {
                                             ++calls;
                                           }})
                    .build();

  nqga::population<nqga::genome_t> population{1};
  nqga::stats::history<nqga::genome_t, nqga::fitness_t> history{};

  // act
  config.observers().notify(nqga::generation_event, population, history);

  // assert
  EXPECT_EQ(calls, 1u);
}

TEST_F(configuration_tests, invalid_probability) {
  // arrange
  settings_.mutation_probability = 1.5;

  // act & assert
  EXPECT_THROW(nqga::make_default_config(settings_, rng_),
               std::invalid_argument);
}

} // namespace tests::configuration
