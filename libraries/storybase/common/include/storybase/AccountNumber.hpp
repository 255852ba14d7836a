#pragma once

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace storybase
{
   namespace detail
   {
      inline constexpr std::string_view nameChars = "-0123456789abcdefghijklmnopqrstuvwxyz";
      inline constexpr std::uint64_t    nameBase  = nameChars.size() + 1;
      inline constexpr std::size_t      maxNameLength = 12;

      constexpr std::uint64_t charToDigit(char c)
      {
         auto pos = nameChars.find(c);
         return pos == std::string_view::npos ? 0 : pos + 1;
      }

      /// Packs a name into its 64-bit form
      ///
      /// Each character is one base-38 digit (0 is reserved for "no character"),
      /// least significant digit first. Returns 0 for names that break the rules.
      constexpr std::uint64_t name_to_number(std::string_view s)
      {
         if (s.empty() || s.size() > maxNameLength)
            return 0;
         if (s.front() < 'a' || s.front() > 'z')
            return 0;
         std::uint64_t result = 0;
         std::uint64_t scale  = 1;
         for (char c : s)
         {
            auto digit = charToDigit(c);
            if (digit == 0)
               return 0;
            result += digit * scale;
            scale *= nameBase;
         }
         return result;
      }

      inline std::string number_to_name(std::uint64_t value)
      {
         std::string result;
         while (value)
         {
            auto digit = value % nameBase;
            if (digit == 0)
               return "#invalid";
            result.push_back(nameChars[digit - 1]);
            value /= nameBase;
         }
         return result;
      }
   }  // namespace detail

   /// An account number or name
   ///
   /// Account numbers are 64-bit values packed from names. Names may
   /// be 1 to 12 characters long and contain the characters `a-z`, `0-9`,
   /// and `-` (hyphen). Names must begin with a letter.
   ///
   /// Names which break these rules pack to value 0, the null account.
   struct AccountNumber
   {
      /// Number form
      std::uint64_t value = 0;

      /// Construct the null account
      constexpr AccountNumber() : value(0) {}

      /// Construct from 64-bit value
      constexpr explicit AccountNumber(std::uint64_t value) : value(value) {}

      /// Construct from string (name)
      constexpr explicit AccountNumber(std::string_view s) : value(detail::name_to_number(s)) {}

      /// Get string (name)
      std::string str() const { return detail::number_to_name(value); }

      friend auto operator<=>(const AccountNumber&, const AccountNumber&) = default;
   };

   std::ostream& operator<<(std::ostream& os, const AccountNumber& account);

   inline namespace literals
   {
      consteval AccountNumber operator""_a(const char* s, unsigned long len)
      {
         auto num = AccountNumber(std::string_view{s, len});
         if (not num.value)
         {
            throw "failed to pack account name";
         }
         return num;
      }
   }  // namespace literals
}  // namespace storybase
