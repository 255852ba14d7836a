#pragma once
#include <storybase/AccountNumber.hpp>
#include <storybase/Service.hpp>
#include <storybase/Table.hpp>

#include <cstdint>
#include <optional>
#include <tuple>

namespace SystemService
{
   /// Shows statistics accross accounts
   ///
   /// `totalAccounts` holds the total number of accounts on chain
   struct AccountsStatus
   {
      std::uint32_t totalAccounts = 0;

      std::tuple<> key() const { return {}; }
   };
   using AccountsStatusTable = storybase::Table<AccountsStatus, &AccountsStatus::key>;

   /// Structure of an account
   ///
   /// `accountNum` is the name of the account
   struct Account
   {
      storybase::AccountNumber accountNum;

      auto key() const { return accountNum; }

      friend bool operator==(const Account&, const Account&) = default;
   };
   using AccountTable = storybase::Table<Account, &Account::key>;

   /// This service facilitates the creation of new accounts
   ///
   /// Only the Accounts service itself may create new accounts.
   /// Other services use this service to check if an account exists.
   class Accounts : public storybase::Service<Accounts>
   {
     public:
      /// "accounts"
      static constexpr auto service = storybase::AccountNumber("accounts");
      /// AccountNumber 0 is reserved for the null account
      static constexpr storybase::AccountNumber nullAccount = storybase::AccountNumber(0);

      using Tables = storybase::ServiceTables<AccountsStatusTable, AccountTable>;

      explicit Accounts(const storybase::ActionContext& context);

      /// Only called once during chain initialization
      ///
      /// Creates the account of the Accounts service itself.
      void init();

      /// Used to create a new account
      ///
      /// Only the Accounts service may call this action. If the `requireNew`
      /// flag is set, then the action will fail if the `name` account already
      /// exists.
      void newAccount(storybase::AccountNumber name, bool requireNew);

      /// Returns data about an account from the accounts table
      std::optional<Account> getAccount(storybase::AccountNumber name);

      /// Return value indicates whether the account `name` exists
      bool exists(storybase::AccountNumber name);

      std::uint32_t numAccounts();
   };
}  // namespace SystemService
