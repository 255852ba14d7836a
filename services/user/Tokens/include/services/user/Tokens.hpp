#pragma once

#include <storybase/Memo.hpp>
#include <storybase/Service.hpp>

#include <services/system/CommonTables.hpp>
#include <services/user/tokenErrors.hpp>
#include <services/user/tokenTables.hpp>
#include <services/user/tokenTypes.hpp>

namespace UserService
{
   /// Holds the liquid balance of every account in the native token
   class Tokens : public storybase::Service<Tokens>
   {
     public:
      using Tables = storybase::ServiceTables<BalanceTable, SupplyTable, InitTable>;

      using Memo = storybase::Memo;

      static constexpr auto service = storybase::AccountNumber("tokens");

      explicit Tokens(const storybase::ActionContext& context);

      void init();

      /// Issue new tokens into existence
      ///
      /// * Requires - Sender is the Tokens service itself. This is only
      ///   used while booting the chain.
      ///
      /// # Arguments
      /// * `receiver` - Account that receives the new tokens
      /// * `amount`   - Amount of tokens to issue
      /// * `memo`     - Memo
      void issue(storybase::AccountNumber receiver, Quantity amount, Memo memo);

      /// Credit
      ///
      /// Moves `amount` from the sender's balance to `receiver`.
      ///
      /// # Arguments
      /// * `receiver` - Recipient of the tokens
      /// * `amount`   - Amount to send
      /// * `memo`     - Memo
      void credit(storybase::AccountNumber receiver, Quantity amount, Memo memo);

      /// Moves `amount` from `owner`'s balance to `receiver`
      ///
      /// * Requires - Sender is `owner`, or `owner` signed the transaction.
      ///   This lets a service that `owner` called move `owner`'s funds
      ///   on their behalf.
      void transferFrom(storybase::AccountNumber owner,
                        storybase::AccountNumber receiver,
                        Quantity                 amount,
                        Memo                     memo);

      // Read-only:
      Quantity getBalance(storybase::AccountNumber account);
      Quantity getSupply();

     private:
      void move(storybase::AccountNumber sender,
                storybase::AccountNumber receiver,
                Quantity                 amount,
                const Memo&              memo);
      void checkAccountValid(storybase::AccountNumber account);
   };
}  // namespace UserService
