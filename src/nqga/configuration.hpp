
#pragma once

#include "criteria.hpp"
#include "observing.hpp"

#include <cstdint>

namespace nqga {

// how the next generation is refilled after the elites are copied
enum class fill_policy {
  // breed until the generation holds exactly the population size
  exact,
  // floor(size / 2) - 1 breeding rounds of two children plus the elites
  legacy
};

struct settings {
  std::size_t population_size{50};
  std::size_t queens{8};
  std::int64_t generation_limit{100};
  std::size_t survivals{2};
  bool single{false};
  double mutation_probability{0.5};
  fill_policy fill{fill_policy::exact};
};

namespace config {

  struct unset {};

  template<typename Ty>
  concept assigned = !std::same_as<Ty, unset>;

  namespace details {

    template<typename Initializator>
    struct chromosome_of {
      using type = unset;
    };

    template<initializator Initializator>
    struct chromosome_of<Initializator> {
      using type = std::invoke_result_t<Initializator const&>;
    };

    template<typename Initializator>
    using chromosome_of_t = typename chromosome_of<Initializator>::type;

  } // namespace details

  template<initializator Initializator,
           typename Evaluator,
           typename Selection,
           typename Crossover,
           typename Mutation,
           typename Criterion,
           typename Observers>
  class algo_config {
  public:
    using initializator_t = Initializator;
    using evaluator_t = Evaluator;
    using selection_t = Selection;
    using crossover_t = Crossover;
    using mutation_t = Mutation;
    using criterion_t = Criterion;
    using observers_t = Observers;

    using chromosome_t = std::invoke_result_t<initializator_t const&>;
    using fitness_t = get_evaluator_result_t<chromosome_t, evaluator_t>;

  public:
    inline algo_config(nqga::settings const& settings,
                       initializator_t const& initializator,
                       evaluator_t const& evaluator,
                       fitness_t target,
                       selection_t const& selection,
                       crossover_t const& crossover,
                       mutation_t const& mutation,
                       criterion_t const& criterion,
                       observers_t const& observers)
        : settings_{settings}
        , initializator_{initializator}
        , evaluator_{evaluator}
        , target_{target}
        , selection_{selection}
        , crossover_{crossover}
        , mutation_{mutation}
        , criterion_{criterion}
        , observers_{observers} {
    }

    inline auto const& initializator() const noexcept {
      return initializator_;
    }

    inline auto const& evaluator() const noexcept {
      return evaluator_;
    }

    inline auto const& selection() const noexcept {
      return selection_;
    }

    inline auto const& crossover() const noexcept {
      return crossover_;
    }

    inline auto const& mutation() const noexcept {
      return mutation_;
    }

    inline auto const& criterion() const noexcept {
      return criterion_;
    }

    inline auto& observers() noexcept {
      return observers_;
    }

    inline auto const& settings() const noexcept {
      return settings_;
    }

    inline fitness_t target_fitness() const noexcept {
      return target_;
    }

    inline std::size_t population_size() const noexcept {
      return settings_.population_size;
    }

    inline std::size_t survivals() const noexcept {
      return settings_.survivals;
    }

    inline bool single() const noexcept {
      return settings_.single;
    }

    inline fill_policy fill() const noexcept {
      return settings_.fill;
    }

  private:
    nqga::settings settings_;

    initializator_t initializator_;
    evaluator_t evaluator_;
    fitness_t target_;
    selection_t selection_;
    crossover_t crossover_;
    mutation_t mutation_;
    criterion_t criterion_;
    observers_t observers_;
  };

  // operators are supplied in order: spawn, evaluate, select, reproduce;
  // stop and observe are optional and may follow
  template<typename Initializator = unset,
           typename Evaluator = unset,
           typename Selection = unset,
           typename Crossover = unset,
           typename Mutation = unset,
           typename Criterion = criteria::generation_limit,
           typename Observers = observer_pack<>>
  class builder {
  public:
    using chromosome_t = details::chromosome_of_t<Initializator>;

  private:
    template<typename, typename, typename, typename, typename, typename, typename>
    friend class builder;

  public:
    inline explicit builder(nqga::settings const& settings)
        : settings_{settings}
        , initializator_{}
        , evaluator_{}
        , target_{max_fitness(settings.queens)}
        , selection_{}
        , crossover_{}
        , mutation_{}
        , criterion_{settings.generation_limit}
        , observers_{} {
    }

    template<initializator Init>
      requires(!assigned<Initializator>)
    inline auto spawn(Init const& initializator) const {
      return next<Init, Evaluator, Selection, Crossover, Mutation>(
          initializator, evaluator_, selection_, crossover_, mutation_);
    }

    template<evaluator<chromosome_t> Eval>
      requires(assigned<Initializator> && !assigned<Evaluator>)
    inline auto evaluate(Eval const& evaluator) const {
      return next<Initializator, Eval, Selection, Crossover, Mutation>(
          initializator_, evaluator, selection_, crossover_, mutation_);
    }

    template<evaluator<chromosome_t> Eval>
      requires(assigned<Initializator> && !assigned<Evaluator>)
    inline auto evaluate(Eval const& evaluator, fitness_t target) const {
      auto result = evaluate(evaluator);
      result.target_ = target;
      return result;
    }

    template<typename Select>
      requires(assigned<Evaluator> && !assigned<Selection>)
    inline auto select(Select const& selection) const {
      return next<Initializator, Evaluator, Select, Crossover, Mutation>(
          initializator_, evaluator_, selection, crossover_, mutation_);
    }

    template<crossover_operation<chromosome_t> Cross,
             mutation_operation<chromosome_t> Mutate>
      requires(assigned<Selection> && !assigned<Crossover>)
    inline auto reproduce(Cross const& crossover, Mutate const& mutation) const {
      return next<Initializator, Evaluator, Selection, Cross, Mutate>(
          initializator_, evaluator_, selection_, crossover, mutation);
    }

    template<typename Stop>
    inline auto stop(Stop const& criterion) const {
      return builder<Initializator,
                     Evaluator,
                     Selection,
                     Crossover,
                     Mutation,
                     Stop,
                     Observers>{settings_,
                                initializator_,
                                evaluator_,
                                target_,
                                selection_,
                                crossover_,
                                mutation_,
                                criterion,
                                observers_};
    }

    template<typename Event, typename Observer>
    inline auto observe(nqga::observe<Event, Observer> const& observer) const {
      auto observers = observers_.add(observer);

      return builder<Initializator,
                     Evaluator,
                     Selection,
                     Crossover,
                     Mutation,
                     Criterion,
                     decltype(observers)>{settings_,
                                          initializator_,
                                          evaluator_,
                                          target_,
                                          selection_,
                                          crossover_,
                                          mutation_,
                                          criterion_,
                                          observers};
    }

    inline auto build() const
      requires(assigned<Crossover>)
    {
      using evaluator_result_t = get_evaluator_result_t<chromosome_t, Evaluator>;

      return algo_config<Initializator,
                         Evaluator,
                         Selection,
                         Crossover,
                         Mutation,
                         Criterion,
                         Observers>{settings_,
                                    initializator_,
                                    evaluator_,
                                    static_cast<evaluator_result_t>(target_),
                                    selection_,
                                    crossover_,
                                    mutation_,
                                    criterion_,
                                    observers_};
    }

  private:
    inline builder(nqga::settings const& settings,
                   Initializator const& initializator,
                   Evaluator const& evaluator,
                   fitness_t target,
                   Selection const& selection,
                   Crossover const& crossover,
                   Mutation const& mutation,
                   Criterion const& criterion,
                   Observers const& observers)
        : settings_{settings}
        , initializator_{initializator}
        , evaluator_{evaluator}
        , target_{target}
        , selection_{selection}
        , crossover_{crossover}
        , mutation_{mutation}
        , criterion_{criterion}
        , observers_{observers} {
    }

    template<typename Init,
             typename Eval,
             typename Select,
             typename Cross,
             typename Mutate>
    inline auto next(Init const& initializator,
                     Eval const& evaluator,
                     Select const& selection,
                     Cross const& crossover,
                     Mutate const& mutation) const {
      return builder<Init, Eval, Select, Cross, Mutate, Criterion, Observers>{
          settings_,
          initializator,
          evaluator,
          target_,
          selection,
          crossover,
          mutation,
          criterion_,
          observers_};
    }

  private:
    nqga::settings settings_;

    Initializator initializator_;
    Evaluator evaluator_;
    fitness_t target_;
    Selection selection_;
    Crossover crossover_;
    Mutation mutation_;
    Criterion criterion_;
    Observers observers_;
  };

} // namespace config
} // namespace nqga
