#pragma once

#include <storybase/Service.hpp>

#include <services/system/CommonTables.hpp>
#include <services/user/NftLedger.hpp>
#include <services/user/nftErrors.hpp>
#include <services/user/nftTables.hpp>

#include <optional>

namespace UserService
{
   /// The default [NftLedger]
   ///
   /// Other services mint and move their tokens here. Each record is keyed
   /// by the calling service and the id that service chose.
   class Nft : public storybase::Service<Nft>, public NftLedger
   {
     public:
      using Tables = storybase::ServiceTables<NftTable, InitTable>;

      static constexpr auto service = storybase::AccountNumber("nft");

      explicit Nft(const storybase::ActionContext& context);

      void init();
      void mint(NID nftId, storybase::AccountNumber owner) override;
      void transfer(NID nftId, storybase::AccountNumber from, storybase::AccountNumber to) override;

      // Read-only:
      std::optional<storybase::AccountNumber> ownerOf(NID nftId) override;
      std::optional<NftRecord>                getNft(storybase::AccountNumber issuer, NID nftId);
      bool                                    exists(storybase::AccountNumber issuer, NID nftId);

     private:
      void checkAccountValid(storybase::AccountNumber account);
   };
}  // namespace UserService
