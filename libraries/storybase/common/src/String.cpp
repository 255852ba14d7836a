#include <storybase/String.hpp>

#include <simdjson.h>

namespace storybase
{
   bool isValidUtf8(std::string_view str)
   {
      return simdjson::validate_utf8(str.data(), str.size());
   }

   std::optional<std::size_t> utf8Length(std::string_view str)
   {
      if (!isValidUtf8(str))
         return std::nullopt;
      std::size_t result = 0;
      for (unsigned char ch : str)
      {
         // continuation bytes are 10xxxxxx
         if ((ch & 0xc0) != 0x80)
            ++result;
      }
      return result;
   }
}  // namespace storybase
