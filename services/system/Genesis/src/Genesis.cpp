#include <services/system/Genesis.hpp>

#include <services/system/Accounts.hpp>
#include <services/user/Nft.hpp>
#include <services/user/StoryNft.hpp>
#include <services/user/Tokens.hpp>
#include <storybase/log.hpp>

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <charconv>
#include <stdexcept>

using namespace storybase;
using UserService::Nft;
using UserService::Quantity;
using UserService::StoryNft;
using UserService::Tokens;

namespace SystemService
{
   namespace
   {
      void expectSuccess(const TransactionTrace& trace)
      {
         if (trace.error)
            throw std::runtime_error("genesis " + trace.service.str() + "::" + trace.method +
                                     " failed: " + *trace.error);
      }
   }  // namespace

   InitialBalance parseInitialBalance(std::string_view s)
   {
      auto pos = s.find(':');
      if (pos == std::string_view::npos)
         throw std::runtime_error("expected name:amount");

      auto name    = s.substr(0, pos);
      auto account = AccountNumber{name};
      if (!account.value || account.str() != name)
         throw std::runtime_error("invalid account name: " + std::string(name));

      auto                 amountStr = s.substr(pos + 1);
      auto                 last      = amountStr.data() + amountStr.size();
      Quantity::Quantity_t amount    = 0;
      auto [end, err]                = std::from_chars(amountStr.data(), last, amount);
      if (amountStr.empty() || err != std::errc{} || end != last)
         throw std::runtime_error("invalid amount: " + std::string(amountStr));

      return InitialBalance{account, amount};
   }

   void validate(boost::any& v, const std::vector<std::string>& values, InitialBalance*, int)
   {
      boost::program_options::validators::check_first_occurrence(v);
      std::string s = boost::program_options::validators::get_single_string(values);
      try
      {
         v = parseInitialBalance(s);
      }
      catch (std::exception&)
      {
         throw boost::program_options::invalid_option_value(s);
      }
   }

   void boot(Chain& chain, const GenesisConfig& config)
   {
      chain.registerService<Accounts>();
      chain.registerService<Tokens>();
      chain.registerService<Nft>();
      chain.registerService<StoryNft>();

      expectSuccess(chain.pushAction<Accounts>(Accounts::service, "init",
                                               [](Accounts& accounts) { accounts.init(); }));
      for (auto service : {Tokens::service, Nft::service, StoryNft::service})
      {
         expectSuccess(chain.pushAction<Accounts>(Accounts::service, "newAccount",
                                                  [&](Accounts& accounts)
                                                  { accounts.newAccount(service, true); }));
      }

      expectSuccess(
          chain.pushAction<Tokens>(Tokens::service, "init", [](Tokens& tokens) { tokens.init(); }));
      expectSuccess(chain.pushAction<Nft>(Nft::service, "init", [](Nft& nft) { nft.init(); }));

      auto tokenUri =
          config.tokenUri.empty() ? std::string(StoryNft::defaultTokenUri) : config.tokenUri;
      expectSuccess(chain.pushAction<StoryNft>(StoryNft::service, "init",
                                               [&](StoryNft& story)
                                               { story.init(Nft::service, tokenUri); }));

      for (auto account : config.accounts)
      {
         expectSuccess(chain.pushAction<Accounts>(Accounts::service, "newAccount",
                                                  [&](Accounts& accounts)
                                                  { accounts.newAccount(account, false); }));
      }

      for (const auto& balance : config.balances)
      {
         expectSuccess(chain.pushAction<Tokens>(
             Tokens::service, "issue", [&](Tokens& tokens)
             { tokens.issue(balance.account, balance.amount, "Genesis balance"); }));
      }

      STORYBASE_LOG(loggers::generic::get(), info)
          << "Booted chain with " << config.accounts.size() << " accounts and "
          << config.balances.size() << " initial balances";
   }
}  // namespace SystemService
