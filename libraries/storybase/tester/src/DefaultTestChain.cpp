#include <storybase/DefaultTestChain.hpp>

#include <services/system/Accounts.hpp>
#include <services/user/Tokens.hpp>

using namespace storybase;
using namespace SystemService;
using namespace UserService;

DefaultTestChain::DefaultTestChain() : DefaultTestChain(GenesisConfig{}) {}

DefaultTestChain::DefaultTestChain(const GenesisConfig& config)
{
   boot(chain(), config);
}

AccountNumber DefaultTestChain::addAccount(const char* name, bool show /* = false */)
{
   return addAccount(AccountNumber(name), show);
}

AccountNumber DefaultTestChain::addAccount(AccountNumber name, bool show /* = false */)
{
   auto trace = from(Accounts::service).to<Accounts>().call(&Accounts::newAccount, name, true);

   check(storybase::show(show, trace.trace()) == "", "Failed to add account");

   return name;
}

void DefaultTestChain::fund(AccountNumber account, Quantity amount, bool show /* = false */)
{
   auto trace = from(Tokens::service)
                    .to<Tokens>()
                    .call(&Tokens::issue, account, amount, "Funded by test chain");

   check(storybase::show(show, trace.trace()) == "", "Failed to fund account");
}
