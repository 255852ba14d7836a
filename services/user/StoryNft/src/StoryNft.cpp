#include <services/user/StoryNft.hpp>

#include <services/system/commonErrors.hpp>
#include <services/user/Tokens.hpp>
#include <storybase/String.hpp>

#include <limits>
#include <string>

using namespace storybase;
using namespace UserService;
using namespace UserService::Errors;
using std::optional;
using std::string;

namespace
{
   bool lengthWithin(std::string_view text, std::size_t minLength, std::size_t maxLength)
   {
      auto length = utf8Length(text);
      return length && *length >= minLength && *length <= maxLength;
   }
}  // namespace

StoryNft::StoryNft(const ActionContext& context) : Service(context)
{
   if (context.method != "init")
   {
      auto initRecord = tables().open<InitTable>().get(std::tuple{});
      check(initRecord.has_value(), uninitialized);
   }
}

void StoryNft::init(AccountNumber ledger, string tokenUri)
{
   auto initTable = tables().open<InitTable>();
   auto init      = initTable.get(std::tuple{});
   check(not init.has_value(), alreadyInit);
   check(ledger.value != 0, invalidAccount);
   initTable.put(InitializedRecord{});

   tables().open<StoryConfigTable>().put(StoryConfigRecord{
       .ledger   = ledger,              //
       .tokenUri = std::move(tokenUri)  //
   });
   tables().open<StoryCounterTable>().put(StoryCounterRecord{});
}

StoryId StoryNft::mint(string                    title,
                       string                    description,
                       std::vector<std::uint8_t> audioCid,
                       std::vector<std::uint8_t> imageCid,
                       std::uint64_t             royaltyPercent)
{
   auto creator = getSender();

   check(lengthWithin(title, 1, StoryRecord::maxTitleLength), invalidStory);
   check(royaltyPercent <= StoryRecord::maxRoyaltyPercent, invalidStory);
   check(lengthWithin(description, 0, StoryRecord::maxDescriptionLength), invalidStory);
   check(audioCid.size() <= StoryRecord::maxCidBytes, invalidStory);
   check(imageCid.size() <= StoryRecord::maxCidBytes, invalidStory);

   auto counterTable = tables().open<StoryCounterTable>();
   auto counter      = counterTable.get(std::tuple{}).value_or(StoryCounterRecord{});
   check(counter.lastTokenId < std::numeric_limits<StoryId>::max(), "Story ids exhausted");
   auto newId = ++counter.lastTokenId;
   counterTable.put(counter);

   auto story = StoryRecord{
       .id             = newId,
       .title          = std::move(title),
       .description    = std::move(description),
       .audioCid       = std::move(audioCid),
       .imageCid       = std::move(imageCid),
       .creator        = creator,
       .royaltyPercent = static_cast<std::uint8_t>(royaltyPercent),
   };
   tables().open<StoryTable>().put(story);

   ledger()->mint(newId, creator);

   emit().history("minted", {{"tokenId", std::to_string(newId)},
                             {"creator", creator.str()},
                             {"title", story.title},
                             {"royaltyPercent", std::to_string(story.royaltyPercent)}});

   return newId;
}

bool StoryNft::transfer(StoryId tokenId, AccountNumber sender, AccountNumber recipient)
{
   auto story = getStory(tokenId);
   check(getSender() == sender, unauthorized);

   // The royalty is a share of whatever the sender holds, there is no sale price
   auto tokens  = to<Tokens>();
   auto royalty = royaltyOf(tokens->getBalance(sender), story.royaltyPercent);

   ledger()->transfer(tokenId, sender, recipient);

   emit().history("transferred", {{"tokenId", std::to_string(tokenId)},
                                  {"sender", sender.str()},
                                  {"recipient", recipient.str()}});

   if (royalty.value > 0 && sender != story.creator)
   {
      tokens->transferFrom(sender, story.creator, royalty,
                           "Royalty for story " + std::to_string(tokenId));

      emit().history("royaltyPaid", {{"tokenId", std::to_string(tokenId)},
                                     {"payer", sender.str()},
                                     {"creator", story.creator.str()},
                                     {"amount", std::to_string(royalty.value)}});
   }

   return true;
}

bool StoryNft::tip(StoryId tokenId, Quantity amount)
{
   auto story  = getStory(tokenId);
   auto tipper = getSender();
   check(amount.value > 0, insufficientFunds);

   to<Tokens>()->transferFrom(tipper, story.creator, amount,
                              "Tip for story " + std::to_string(tokenId));

   emit().history("tipped", {{"tokenId", std::to_string(tokenId)},
                             {"tipper", tipper.str()},
                             {"creator", story.creator.str()},
                             {"amount", std::to_string(amount.value)}});

   return true;
}

optional<StoryRecord> StoryNft::getStoryDetails(StoryId tokenId)
{
   return tables().open<StoryTable>().get(tokenId);
}

optional<AccountNumber> StoryNft::getOwner(StoryId tokenId)
{
   return ledger()->ownerOf(tokenId);
}

StoryId StoryNft::getLastTokenId()
{
   auto counter = tables().open<StoryCounterTable>().get(std::tuple{});
   return counter ? counter->lastTokenId : 0;
}

optional<string> StoryNft::getTokenUri(StoryId /*tokenId*/)
{
   return getConfig().tokenUri;
}

Quantity StoryNft::royaltyOf(Quantity balance, std::uint8_t royaltyPercent)
{
   check(royaltyPercent <= StoryRecord::maxRoyaltyPercent, invalidStory);

   // floor(balance * pct / 100) without overflowing the product
   auto whole = balance.value / 100;
   auto part  = balance.value % 100;
   return Quantity{whole * royaltyPercent + part * royaltyPercent / 100};
}

StoryRecord StoryNft::getStory(StoryId tokenId)
{
   auto story = tables().open<StoryTable>().get(tokenId);
   check(story.has_value(), storyNotFound);
   return std::move(*story);
}

StoryConfigRecord StoryNft::getConfig()
{
   auto config = tables().open<StoryConfigTable>().get(std::tuple{});
   check(config.has_value(), uninitialized);
   return *config;
}

Actor<NftLedger> StoryNft::ledger()
{
   return to<NftLedger>(getConfig().ledger);
}
