#include <services/user/Tokens.hpp>

#include <services/system/Accounts.hpp>
#include <services/system/commonErrors.hpp>

#include <limits>
#include <string>

using namespace UserService;
using namespace UserService::Errors;
using namespace storybase;
using SystemService::Accounts;

Tokens::Tokens(const ActionContext& context) : Service(context)
{
   if (context.method != "init")
   {
      auto initRecord = tables().open<InitTable>().getIndex<0>().get(std::tuple{});
      check(initRecord.has_value(), uninitialized);
   }
}

void Tokens::init()
{
   // Set initialized flag
   auto initTable = tables().open<InitTable>();
   auto init      = (initTable.getIndex<0>().get(std::tuple{}));
   check(not init.has_value(), alreadyInit);
   initTable.put(InitializedRecord{});

   tables().open<SupplyTable>().put(SupplyRecord{.issuedSupply = 0});
}

void Tokens::issue(AccountNumber receiver, Quantity amount, Memo memo)
{
   auto supplyTable = tables().open<SupplyTable>();
   auto supply      = supplyTable.get(std::tuple{}).value_or(SupplyRecord{});

   check(getSender() == service, missingRequiredAuth);
   check(amount.value > 0, quantityGt0);
   checkAccountValid(receiver);
   check(supply.issuedSupply.value <=
             std::numeric_limits<Quantity::Quantity_t>::max() - amount.value,
         tokenOverflow);

   auto balanceTable = tables().open<BalanceTable>();
   auto balance      = balanceTable.get(receiver).value_or(BalanceRecord{receiver, 0});

   supply.issuedSupply += amount;
   balance.balance += amount;
   supplyTable.put(supply);
   balanceTable.put(balance);

   emit().history("issued", {{"receiver", receiver.str()},
                             {"amount", std::to_string(amount.value)},
                             {"memo", memo.contents}});
}

void Tokens::credit(AccountNumber receiver, Quantity amount, Memo memo)
{
   move(getSender(), receiver, amount, memo);
}

void Tokens::transferFrom(AccountNumber owner, AccountNumber receiver, Quantity amount, Memo memo)
{
   check(getSender() == owner || getTransactionSender() == owner, missingRequiredAuth);
   move(owner, receiver, amount, memo);
}

Quantity Tokens::getBalance(AccountNumber account)
{
   auto balance = tables().open<BalanceTable>().get(account);
   if (balance.has_value())
      return balance->balance;

   checkAccountValid(account);
   return 0;
}

Quantity Tokens::getSupply()
{
   auto supply = tables().open<SupplyTable>().get(std::tuple{});
   return supply ? supply->issuedSupply : Quantity{0};
}

void Tokens::move(AccountNumber sender, AccountNumber receiver, Quantity amount, const Memo& memo)
{
   auto balanceTable    = tables().open<BalanceTable>();
   auto senderBalance   = balanceTable.get(sender).value_or(BalanceRecord{sender, 0});
   auto receiverBalance = balanceTable.get(receiver).value_or(BalanceRecord{receiver, 0});

   check(sender != receiver, senderIsReceiver);
   check(amount.value > 0, quantityGt0);
   checkAccountValid(receiver);
   check(amount.value <= senderBalance.balance.value, insufficientBalance);
   check(receiverBalance.balance.value <=
             std::numeric_limits<Quantity::Quantity_t>::max() - amount.value,
         tokenOverflow);

   senderBalance.balance -= amount;
   receiverBalance.balance += amount;

   if (senderBalance.balance.value == 0)
   {
      balanceTable.erase(sender);
   }
   else
   {
      balanceTable.put(senderBalance);
   }
   balanceTable.put(receiverBalance);

   emit().history("transferred", {{"sender", sender.str()},
                                  {"receiver", receiver.str()},
                                  {"amount", std::to_string(amount.value)},
                                  {"memo", memo.contents}});
}

void Tokens::checkAccountValid(AccountNumber account)
{
   check(account != Accounts::nullAccount, invalidAccount);
   check(to<Accounts>()->exists(account), invalidAccount);
}
