#include <storybase/TransactionContext.hpp>

#include <storybase/Chain.hpp>
#include <storybase/check.hpp>

namespace storybase
{
   TransactionContext::TransactionContext(Chain& chain, Database& db, TransactionTrace& trace)
       : transactionTrace(trace), chain(chain), db(db)
   {
   }

   std::unique_ptr<ServiceBase> TransactionContext::createService(const ActionContext& context)
   {
      check(++numCalls <= maxCalls, "Too many service calls in one transaction");
      return chain.createService(context);
   }

   void TransactionContext::emitEvent(Event event)
   {
      transactionTrace.events.push_back(std::move(event));
   }
}  // namespace storybase
