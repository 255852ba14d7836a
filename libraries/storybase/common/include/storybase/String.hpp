#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace storybase
{
   /// Returns true if `str` is valid UTF-8
   bool isValidUtf8(std::string_view str);

   /// Number of code points in `str`
   ///
   /// Returns nullopt if `str` isn't valid UTF-8.
   std::optional<std::size_t> utf8Length(std::string_view str);
}  // namespace storybase
