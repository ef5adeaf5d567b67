#pragma once

#include <compare>

namespace gossamer::detail {

/// Derives equality and ordering for `Derived` from its member function
/// `int compare(const Derived&) const noexcept`. The remaining relational
/// operators are synthesized from `operator<=>`.
template <class Derived>
class comparable {
  friend bool operator==(const Derived& lhs, const Derived& rhs) noexcept {
    return lhs.compare(rhs) == 0;
  }

  friend std::strong_ordering operator<=>(const Derived& lhs,
                                          const Derived& rhs) noexcept {
    return lhs.compare(rhs) <=> 0;
  }
};

} // namespace gossamer::detail
