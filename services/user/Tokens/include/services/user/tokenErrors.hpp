#pragma once

#include <string_view>

namespace UserService
{
   namespace Errors
   {
      constexpr std::string_view tokenOverflow       = "Token overflow";
      constexpr std::string_view insufficientBalance = "Insufficient token balance";
      constexpr std::string_view quantityGt0         = "Quantity must be greater than 0";
      constexpr std::string_view senderIsReceiver    = "Sender cannot be receiver";
   }  // namespace Errors
}  // namespace UserService
