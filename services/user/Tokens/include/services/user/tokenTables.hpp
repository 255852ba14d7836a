#pragma once

#include <storybase/AccountNumber.hpp>
#include <storybase/Table.hpp>

#include <services/user/tokenTypes.hpp>

#include <tuple>

namespace UserService
{
   struct BalanceRecord
   {
      storybase::AccountNumber account;
      Quantity                 balance;

      auto operator<=>(const BalanceRecord&) const = default;
   };
   using BalanceTable = storybase::Table<BalanceRecord, &BalanceRecord::account>;

   /// Total amount of the native token that has been issued
   struct SupplyRecord
   {
      Quantity issuedSupply;

      std::tuple<> key() const { return {}; }
   };
   using SupplyTable = storybase::Table<SupplyRecord, &SupplyRecord::key>;

}  // namespace UserService
