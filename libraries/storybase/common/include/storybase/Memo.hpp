#pragma once

#include <storybase/String.hpp>
#include <storybase/check.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace storybase
{
   /// A memo is a human readable string that is passed as an action argument.
   /// A memo must be valid UTF-8 and not longer than 80 bytes.
   struct Memo
   {
      static constexpr std::uint8_t maxBytes = 80;

      std::string contents;

      Memo(const std::string& s) : contents{s} { validate(s); }
      Memo(const char* s) : Memo(std::string{s}) {}
      Memo() : Memo("") {}

      static bool validate(std::string_view str)
      {
         storybase::check(str.size() <= maxBytes, "Memo exceeds 80 bytes");
         storybase::check(isValidUtf8(str), "Memo must be valid UTF-8");
         return true;
      }
   };
}  // namespace storybase
