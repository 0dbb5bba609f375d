
#pragma once

#include <concepts>
#include <type_traits>

namespace nqga::util {

template<typename Ref, typename Decayed>
concept forward_ref = std::same_as<Decayed, std::remove_cvref_t<Ref>>;

} // namespace nqga::util
