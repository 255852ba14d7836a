#pragma once

#include <storybase/ActionContext.hpp>
#include <storybase/Service.hpp>

#include <services/system/CommonTables.hpp>
#include <services/user/NftLedger.hpp>
#include <services/user/storyErrors.hpp>
#include <services/user/storyTables.hpp>
#include <services/user/tokenTypes.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace UserService
{
   /// Registry of story tokens
   ///
   /// A creator mints a token that describes a story. Ownership of the token
   /// is kept in an [NftLedger]; every transfer pays the creator a royalty
   /// out of the sender's balance in [Tokens], and anyone may tip the creator.
   class StoryNft : public storybase::Service<StoryNft>
   {
     public:
      using Tables =
          storybase::ServiceTables<StoryTable, StoryCounterTable, StoryConfigTable, InitTable>;

      static constexpr auto             service         = storybase::AccountNumber("story-nft");
      static constexpr std::string_view defaultTokenUri = "https://story-nft.example/metadata";

      explicit StoryNft(const storybase::ActionContext& context);

      /// Only called once during chain initialization
      ///
      /// # Arguments
      /// * `ledger`   - Service that records token ownership
      /// * `tokenUri` - Value returned by [getTokenUri] for every token
      void init(storybase::AccountNumber ledger, std::string tokenUri);

      /// Mint a new story token owned by the sender
      ///
      /// The title must be 1 to 100 characters and the description at most 500,
      /// counted in code points. Content ids may be at most 64 bytes and the
      /// royalty at most 100 percent. Anything else aborts with `400 InvalidStory`.
      ///
      /// # Returns the id of the new token, which is one more than the previous id
      StoryId mint(std::string               title,
                   std::string               description,
                   std::vector<std::uint8_t> audioCid,
                   std::vector<std::uint8_t> imageCid,
                   std::uint64_t             royaltyPercent);

      /// Transfer a token from `sender` to `recipient`
      ///
      /// Only `sender` may call this. Pays the creator `royaltyPercent` of
      /// `sender`'s current balance, unless `sender` is the creator.
      bool transfer(StoryId                  tokenId,
                    storybase::AccountNumber sender,
                    storybase::AccountNumber recipient);

      /// Send `amount` from the sender to the creator of `tokenId`
      bool tip(StoryId tokenId, Quantity amount);

      // Read-only:
      std::optional<StoryRecord>              getStoryDetails(StoryId tokenId);
      std::optional<storybase::AccountNumber> getOwner(StoryId tokenId);
      StoryId                                 getLastTokenId();
      std::optional<std::string>              getTokenUri(StoryId tokenId);

      /// `royaltyPercent` of `balance`, rounded down
      static Quantity royaltyOf(Quantity balance, std::uint8_t royaltyPercent);

     private:
      StoryRecord                 getStory(StoryId tokenId);
      StoryConfigRecord           getConfig();
      storybase::Actor<NftLedger> ledger();
   };
}  // namespace UserService
