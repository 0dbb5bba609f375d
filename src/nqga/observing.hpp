
#pragma once

#include "utility.hpp"

#include <functional>
#include <tuple>
#include <utility>

namespace nqga {

struct generation_event_t {};
inline constexpr generation_event_t generation_event{};

template<typename Event, typename Observer>
class observe {
public:
  using event_t = Event;
  using observer_t = Observer;

public:
  inline constexpr observe(event_t /*unused*/, observer_t const& observer)
      : observer_{observer} {
  }

  inline constexpr observe(event_t /*unused*/, observer_t&& observer)
      : observer_{std::move(observer)} {
  }

  inline auto& observer() noexcept {
    return observer_;
  }

private:
  observer_t observer_;
};

template<typename... Observes>
class observer_pack {
private:
  using observers_t = std::tuple<Observes...>;

public:
  observer_pack() = default;

  inline constexpr explicit observer_pack(observers_t observers)
      : observers_{std::move(observers)} {
  }

  template<typename Event, typename Observer>
  inline constexpr auto add(observe<Event, Observer> observer) const {
    return observer_pack<Observes..., observe<Event, Observer>>{
        std::tuple_cat(observers_, std::tuple{std::move(observer)})};
  }

  // notifies, in registration order, every observer attached to the event
  template<typename Event, typename... Args>
  inline void notify(Event /*unused*/, Args&&... args) {
    std::apply(
        [&args...](auto&... observers) {
          (notify_one<Event>(observers, args...), ...);
        },
        observers_);
  }

private:
  template<typename Event, typename Observe, typename... Args>
  inline static void notify_one(Observe& observer, Args&... args) {
    if constexpr (std::same_as<typename Observe::event_t, Event>) {
      std::invoke(observer.observer(), std::as_const(args)...);
    }
  }

private:
  observers_t observers_;
};

} // namespace nqga
