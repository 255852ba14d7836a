#pragma once

#include <string_view>

namespace UserService
{
   namespace Errors
   {
      constexpr std::string_view nftDNE            = "NFT does not exist";
      constexpr std::string_view invalidNftId      = "NFT ID invalid";
      constexpr std::string_view nftAlreadyMinted  = "NFT ID already minted";
      constexpr std::string_view notNftOwner       = "Sender does not own the NFT";
      constexpr std::string_view creditorIsDebitor = "Creditor and debitor cannot be the same";
   }  // namespace Errors
}  // namespace UserService
