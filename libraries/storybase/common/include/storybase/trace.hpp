#pragma once

#include <storybase/AccountNumber.hpp>

#include <any>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace storybase
{
   using EventField = std::pair<std::string, std::string>;

   /// A history event emitted by a service
   struct Event
   {
      AccountNumber           service;
      std::string             type;
      std::vector<EventField> fields;
   };

   /// The outcome of a single-action transaction
   ///
   /// `error` is set when the action aborted; in that case none of its
   /// writes or events were kept. `errorCode` is set when the abort carried
   /// a numbered error.
   struct TransactionTrace
   {
      AccountNumber                       sender;
      AccountNumber                       service;
      std::string                         method;
      std::vector<Event>                  events;
      std::any                            returnValue;
      std::optional<std::string>          error;
      std::optional<std::uint32_t>        errorCode;
      std::chrono::steady_clock::duration elapsed{};
   };

   std::string prettyEvent(const Event& event);
   std::string prettyTrace(const TransactionTrace& trace);
}  // namespace storybase
