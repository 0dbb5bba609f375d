
#pragma once

#include "statistics.hpp"

#include <cstdint>

namespace nqga {
namespace criteria {

  // stops once as many generations as the limit have been recorded, negative
  // limit never matches so the search runs until another exit is taken
  class generation_limit {
  public:
    inline explicit generation_limit(std::int64_t limit) noexcept
        : limit_{limit} {
    }

    template<typename Population, typename History>
    inline bool operator()(Population const& /*unused*/,
                           History const& history) const noexcept {
      return static_cast<std::int64_t>(history.size()) == limit_;
    }

    inline std::int64_t limit() const noexcept {
      return limit_;
    }

  private:
    std::int64_t limit_;
  };

  class solved {
  public:
    template<typename Population, typename History>
    inline bool operator()(Population const& /*unused*/,
                           History const& history) const noexcept {
      return !history.empty() && history.current().solved;
    }
  };

} // namespace criteria
} // namespace nqga
