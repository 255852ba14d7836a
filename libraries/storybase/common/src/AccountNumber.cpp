#include <storybase/AccountNumber.hpp>

#include <ostream>

namespace storybase
{
   std::ostream& operator<<(std::ostream& os, const AccountNumber& account)
   {
      return os << account.str();
   }
}  // namespace storybase
