#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <storybase/AccountNumber.hpp>
#include <storybase/Table.hpp>
#include <string>
#include <tuple>
#include <vector>

namespace UserService
{
   using StoryId = std::uint64_t;

   /// Metadata of a minted story
   ///
   /// `audioCid` and `imageCid` are opaque identifiers of off-chain content.
   /// `creator` and `royaltyPercent` never change after the mint.
   struct StoryRecord
   {
      static constexpr std::size_t  maxTitleLength       = 100;
      static constexpr std::size_t  maxDescriptionLength = 500;
      static constexpr std::size_t  maxCidBytes          = 64;
      static constexpr std::uint8_t maxRoyaltyPercent    = 100;

      StoryId                   id;
      std::string               title;
      std::string               description;
      std::vector<std::uint8_t> audioCid;
      std::vector<std::uint8_t> imageCid;
      storybase::AccountNumber  creator;
      std::uint8_t              royaltyPercent;

      auto operator<=>(const StoryRecord&) const = default;
   };
   using StoryTable = storybase::Table<StoryRecord, &StoryRecord::id>;

   /// The id of the most recently minted story; 0 before the first mint
   struct StoryCounterRecord
   {
      StoryId lastTokenId = 0;

      std::tuple<> key() const { return {}; }
   };
   using StoryCounterTable = storybase::Table<StoryCounterRecord, &StoryCounterRecord::key>;

   struct StoryConfigRecord
   {
      /// Service that implements [NftLedger] for story tokens
      storybase::AccountNumber ledger;
      std::string              tokenUri;

      std::tuple<> key() const { return {}; }
   };
   using StoryConfigTable = storybase::Table<StoryConfigRecord, &StoryConfigRecord::key>;

}  // namespace UserService
