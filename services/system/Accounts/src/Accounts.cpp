#include <services/system/Accounts.hpp>

#include <services/system/commonErrors.hpp>
#include <storybase/check.hpp>

#include <string>

using namespace storybase;
using namespace UserService::Errors;

namespace SystemService
{
   Accounts::Accounts(const ActionContext& context) : Service(context)
   {
      if (context.method != "init")
      {
         auto status = tables().open<AccountsStatusTable>().get(std::tuple{});
         check(status.has_value(), uninitialized);
      }
   }

   void Accounts::init()
   {
      Tables tables{database(), getReceiver()};
      auto   statusTable  = tables.open<AccountsStatusTable>();
      auto   accountTable = tables.open<AccountTable>();
      check(!statusTable.get(std::tuple{}), alreadyInit);

      accountTable.put({.accountNum = service});
      statusTable.put({.totalAccounts = 1});
   }

   void Accounts::newAccount(AccountNumber name, bool requireNew)
   {
      Tables tables{database(), getReceiver()};
      auto   statusTable  = tables.open<AccountsStatusTable>();
      auto   accountTable = tables.open<AccountTable>();
      auto   accountIndex = accountTable.getIndex<0>();

      auto status = statusTable.get(std::tuple{});
      check(status.has_value(), uninitialized);
      check(getSender() == service, "unauthorized account creation");

      check(name.value, "invalid account name");
      std::string strName = name.str();
      check(strName.back() != '-', "account name must not end in a hyphen");

      // Check compression roundtrip
      check(AccountNumber{strName} == name, "invalid account name");

      if (accountIndex.get(name))
      {
         if (requireNew)
            abortMessage("account already exists");
         return;
      }

      accountTable.put({.accountNum = name});

      ++status->totalAccounts;
      statusTable.put(*status);
   }

   std::optional<Account> Accounts::getAccount(AccountNumber name)
   {
      return tables().open<AccountTable>().get(name);
   }

   bool Accounts::exists(AccountNumber name)
   {
      return getAccount(name) != std::nullopt;
   }

   std::uint32_t Accounts::numAccounts()
   {
      auto status = tables().open<AccountsStatusTable>().get(std::tuple{});
      return status ? status->totalAccounts : 0;
   }
}  // namespace SystemService
