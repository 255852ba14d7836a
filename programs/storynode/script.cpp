#include "script.hpp"

#include <services/system/Accounts.hpp>
#include <services/user/StoryNft.hpp>
#include <services/user/Tokens.hpp>
#include <storybase/log.hpp>

#include <boost/algorithm/hex.hpp>

#include <any>
#include <charconv>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace storybase;
using SystemService::Accounts;
using UserService::Quantity;
using UserService::StoryNft;
using UserService::StoryRecord;
using UserService::Tokens;

namespace storynode
{
   namespace
   {
      struct usage_error : std::runtime_error
      {
         using std::runtime_error::runtime_error;
      };

      class Args
      {
        public:
         Args(std::istringstream& in) : in(in) {}

         std::string string()
         {
            std::string result;
            if (!(in >> std::quoted(result)))
               throw usage_error("missing argument");
            return result;
         }

         std::uint64_t number()
         {
            auto          s      = string();
            std::uint64_t result = 0;
            auto [end, err]      = std::from_chars(s.data(), s.data() + s.size(), result);
            if (err != std::errc{} || end != s.data() + s.size())
               throw usage_error("not a number: " + s);
            return result;
         }

         AccountNumber account()
         {
            auto s      = string();
            auto result = AccountNumber{s};
            if (!result.value || result.str() != s)
               throw usage_error("not an account name: " + s);
            return result;
         }

         std::vector<std::uint8_t> bytes()
         {
            auto                      s = string();
            std::vector<std::uint8_t> result;
            try
            {
               boost::algorithm::unhex(s.begin(), s.end(), std::back_inserter(result));
            }
            catch (boost::algorithm::hex_decode_error&)
            {
               throw usage_error("not a hex string: " + s);
            }
            return result;
         }

         std::optional<std::string> optionalString()
         {
            std::string result;
            if (in >> std::quoted(result))
               return result;
            return std::nullopt;
         }

         void finish()
         {
            std::string extra;
            if (in >> extra)
               throw usage_error("unexpected argument: " + extra);
         }

        private:
         std::istringstream& in;
      };

      std::string format(bool value) { return value ? "true" : "false"; }
      std::string format(std::uint64_t value) { return std::to_string(value); }
      std::string format(Quantity value) { return std::to_string(value.value); }
      std::string format(AccountNumber value) { return value.str(); }
      std::string format(const std::string& value)
      {
         std::ostringstream os;
         os << std::quoted(value);
         return os.str();
      }

      std::string format(const StoryRecord& story)
      {
         std::ostringstream os;
         os << "{ id: " << story.id << ", title: " << std::quoted(story.title)
            << ", description: " << std::quoted(story.description)
            << ", audioCid: " << boost::algorithm::hex_lower(std::string(
                                     story.audioCid.begin(), story.audioCid.end()))
            << ", imageCid: " << boost::algorithm::hex_lower(std::string(
                                     story.imageCid.begin(), story.imageCid.end()))
            << ", creator: " << story.creator
            << ", royaltyPercent: " << static_cast<unsigned>(story.royaltyPercent) << " }";
         return os.str();
      }

      template <typename T>
      std::string format(const std::optional<T>& value)
      {
         if (!value)
            return "none";
         return format(*value);
      }

      /// Runs one action of `Service` and writes its outcome
      template <typename Service, typename F>
      bool run(Chain&             chain,
               std::ostream&      out,
               AccountNumber      sender,
               const std::string& method,
               F&&                fn)
      {
         auto trace = chain.pushAction<Service>(sender, method, std::forward<F>(fn));
         out << prettyTrace(trace);
         if (trace.error)
         {
            if (trace.errorCode)
               out << "    error code: " << *trace.errorCode << "\n";
            return false;
         }
         using R = std::invoke_result_t<F&, Service&>;
         if constexpr (!std::is_void_v<R>)
            out << "    returned: " << format(std::any_cast<const R&>(trace.returnValue)) << "\n";
         return true;
      }

      using Handler = std::function<bool(Chain&, std::ostream&, AccountNumber, Args&)>;

      const std::map<std::string, Handler, std::less<>>& handlers()
      {
         static const std::map<std::string, Handler, std::less<>> result = {
             {"mint",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto title       = args.string();
                 auto description = args.string();
                 auto audioCid    = args.bytes();
                 auto imageCid    = args.bytes();
                 auto royalty     = args.number();
                 args.finish();
                 return run<StoryNft>(chain, out, sender, "mint",
                                      [&](StoryNft& s)
                                      {
                                         return s.mint(title, description, audioCid, imageCid,
                                                       royalty);
                                      });
              }},
             {"transfer",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto tokenId   = args.number();
                 auto from      = args.account();
                 auto recipient = args.account();
                 args.finish();
                 return run<StoryNft>(chain, out, sender, "transfer", [&](StoryNft& s)
                                      { return s.transfer(tokenId, from, recipient); });
              }},
             {"tip",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto tokenId = args.number();
                 auto amount  = args.number();
                 args.finish();
                 return run<StoryNft>(chain, out, sender, "tip",
                                      [&](StoryNft& s) { return s.tip(tokenId, amount); });
              }},
             {"getStoryDetails",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto tokenId = args.number();
                 args.finish();
                 return run<StoryNft>(chain, out, sender, "getStoryDetails",
                                      [&](StoryNft& s) { return s.getStoryDetails(tokenId); });
              }},
             {"getOwner",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto tokenId = args.number();
                 args.finish();
                 return run<StoryNft>(chain, out, sender, "getOwner",
                                      [&](StoryNft& s) { return s.getOwner(tokenId); });
              }},
             {"getLastTokenId",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 args.finish();
                 return run<StoryNft>(chain, out, sender, "getLastTokenId",
                                      [&](StoryNft& s) { return s.getLastTokenId(); });
              }},
             {"getTokenUri",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto tokenId = args.number();
                 args.finish();
                 return run<StoryNft>(chain, out, sender, "getTokenUri",
                                      [&](StoryNft& s) { return s.getTokenUri(tokenId); });
              }},
             {"credit",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto receiver = args.account();
                 auto amount   = args.number();
                 auto memo     = args.optionalString().value_or("");
                 args.finish();
                 return run<Tokens>(chain, out, sender, "credit",
                                    [&](Tokens& s) { s.credit(receiver, amount, memo); });
              }},
             {"getBalance",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto account = args.account();
                 args.finish();
                 return run<Tokens>(chain, out, sender, "getBalance",
                                    [&](Tokens& s) { return s.getBalance(account); });
              }},
             {"newAccount",
              [](Chain& chain, std::ostream& out, AccountNumber sender, Args& args)
              {
                 auto name = args.account();
                 args.finish();
                 return run<Accounts>(chain, out, sender, "newAccount",
                                      [&](Accounts& s) { s.newAccount(name, true); });
              }},
         };
         return result;
      }
   }  // namespace

   ScriptStats runScript(Chain& chain, std::istream& in, std::ostream& out)
   {
      ScriptStats stats;
      std::string line;
      std::size_t lineNumber = 0;
      while (std::getline(in, line))
      {
         ++lineNumber;
         auto first = line.find_first_not_of(" \t\r");
         if (first == std::string::npos || line[first] == '#')
            continue;

         std::istringstream lineStream{line};
         try
         {
            Args args{lineStream};
            auto sender = args.account();
            auto action = args.string();

            auto it = handlers().find(action);
            if (it == handlers().end())
               throw usage_error("unknown action: " + action);
            if (it->second(chain, out, sender, args))
               ++stats.succeeded;
            else
               ++stats.failed;
         }
         catch (usage_error& e)
         {
            STORYBASE_LOG(loggers::generic::get(), warning)
                << "line " << lineNumber << ": " << e.what();
            out << "line " << lineNumber << ": " << e.what() << "\n";
            ++stats.malformed;
         }
      }
      return stats;
   }
}  // namespace storynode
