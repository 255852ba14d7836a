#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <storybase/check.hpp>
#include <string_view>

namespace UserService
{
   struct Quantity
   {
      using Quantity_t = std::uint64_t;
      Quantity_t                        value = 0;
      static constexpr std::string_view error_overflow  = "overflow in Quantity arithmetic";
      static constexpr std::string_view error_underflow = "underflow in Quantity arithmetic";

      constexpr Quantity(Quantity_t q) : value{q} {}
      Quantity() = default;

      Quantity& operator+=(const Quantity& q2)
      {
         storybase::check(value <= std::numeric_limits<Quantity_t>::max() - q2.value,
                          error_overflow);
         value += q2.value;
         return *this;
      }

      Quantity& operator-=(const Quantity& q2)
      {
         storybase::check(value >= q2.value, error_underflow);
         value -= q2.value;
         return *this;
      }

      constexpr auto operator<=>(const Quantity&) const = default;

      constexpr bool operator==(const Quantity& other) const = default;

      constexpr auto operator<=>(const Quantity_t& other) const { return value <=> other; }

      constexpr bool operator==(const Quantity_t& otherValue) const { return value == otherValue; }
   };

}  // namespace UserService
