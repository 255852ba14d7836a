#pragma once

#include <storybase/AccountNumber.hpp>
#include <storybase/Chain.hpp>

#include <services/user/tokenTypes.hpp>

#include <boost/any.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace SystemService
{
   /// Tokens issued to an account at genesis
   struct InitialBalance
   {
      storybase::AccountNumber account;
      UserService::Quantity    amount;

      friend bool operator==(const InitialBalance&, const InitialBalance&) = default;
   };

   /// Parses `name:amount`
   InitialBalance parseInitialBalance(std::string_view s);

   /// Allows `InitialBalance` to be used with boost::program_options
   void validate(boost::any& v, const std::vector<std::string>& values, InitialBalance*, int);

   /// The initial state of a chain
   ///
   /// Every account named in `balances` must also appear in `accounts`.
   struct GenesisConfig
   {
      std::vector<storybase::AccountNumber> accounts;
      std::vector<InitialBalance>           balances;
      std::string                           tokenUri;
   };

   /// Registers the system and user services on `chain`, initializes
   /// them, and then creates the accounts and balances from `config`
   ///
   /// Throws if any step fails.
   void boot(storybase::Chain& chain, const GenesisConfig& config);
}  // namespace SystemService
