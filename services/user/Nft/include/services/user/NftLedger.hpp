#pragma once

#include <storybase/AccountNumber.hpp>

#include <cstdint>
#include <optional>

namespace UserService
{
   using NID = std::uint64_t;

   /// Ownership ledger for non-fungible tokens
   ///
   /// Token ids are scoped by the issuer, the service that calls the ledger:
   /// two issuers may each mint an id 1 without conflict. Only the issuer
   /// may mint or move its tokens.
   class NftLedger
   {
     public:
      virtual ~NftLedger() = default;

      /// Record that `owner` holds the new token `nftId`
      virtual void mint(NID nftId, storybase::AccountNumber owner) = 0;

      /// Reassign `nftId` from `from` to `to`
      ///
      /// Aborts if `from` does not hold the token.
      virtual void transfer(NID                      nftId,
                            storybase::AccountNumber from,
                            storybase::AccountNumber to) = 0;

      /// The current holder of `nftId`, if it was minted
      virtual std::optional<storybase::AccountNumber> ownerOf(NID nftId) = 0;
   };
}  // namespace UserService
