#pragma once

#include <storybase/ActionContext.hpp>
#include <storybase/Database.hpp>
#include <storybase/trace.hpp>

#include <cstdint>
#include <memory>

namespace storybase
{
   class Chain;

   /// State shared by every action call within one transaction
   class TransactionContext
   {
     public:
      static constexpr std::uint32_t maxCalls = 256;

      TransactionContext(Chain& chain, Database& db, TransactionTrace& trace);

      Database&     database() { return db; }
      AccountNumber getSigner() const { return transactionTrace.sender; }

      /// Creates the service instance that handles a (possibly nested) call
      ///
      /// Aborts if `context.receiver` isn't a registered service or if the
      /// transaction has already made [maxCalls] calls.
      std::unique_ptr<ServiceBase> createService(const ActionContext& context);

      void emitEvent(Event event);

      TransactionTrace& transactionTrace;

     private:
      Chain&        chain;
      Database&     db;
      std::uint32_t numCalls = 0;
   };
}  // namespace storybase
