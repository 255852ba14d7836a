#pragma once
#include <compare>
#include <storybase/AccountNumber.hpp>
#include <storybase/Table.hpp>
#include <tuple>

#include <services/user/NftLedger.hpp>

namespace UserService
{
   struct NftRecord
   {
      storybase::AccountNumber issuer;
      NID                      id;
      storybase::AccountNumber owner;

      static bool isValidKey(const NID& id) { return id != 0; }

      auto key() const { return std::tuple{issuer, id}; }

      auto operator<=>(const NftRecord&) const = default;
   };
   using NftTable = storybase::Table<NftRecord, &NftRecord::key>;

}  // namespace UserService
