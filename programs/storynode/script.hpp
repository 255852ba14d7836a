#pragma once

#include <storybase/Chain.hpp>

#include <cstddef>
#include <iosfwd>

namespace storynode
{
   struct ScriptStats
   {
      std::size_t succeeded = 0;
      std::size_t failed    = 0;
      std::size_t malformed = 0;
   };

   /// Runs one action per line of `in` and reports each outcome to `out`
   ///
   /// A line has the form `<account> <action> <args...>`. Arguments that
   /// contain spaces are written in double quotes, and byte strings are
   /// written in hex. Blank lines and lines starting with `#` are skipped.
   /// A malformed line is reported and skipped; it does not stop the script.
   ScriptStats runScript(storybase::Chain& chain, std::istream& in, std::ostream& out);
}  // namespace storynode
