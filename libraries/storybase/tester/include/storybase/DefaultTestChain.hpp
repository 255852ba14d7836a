#pragma once

#include <storybase/tester.hpp>

#include <services/system/Genesis.hpp>
#include <services/user/tokenTypes.hpp>

namespace storybase
{
   /**
    * Manages a chain that uses the default services.
    */
   class DefaultTestChain : public TestChain
   {
     public:
      DefaultTestChain();
      explicit DefaultTestChain(const SystemService::GenesisConfig& config);

      AccountNumber addAccount(const char* name, bool show = false);
      AccountNumber addAccount(AccountNumber name, bool show = false);

      /// Issues new tokens to `account`
      void fund(AccountNumber account, UserService::Quantity amount, bool show = false);
   };
}  // namespace storybase
