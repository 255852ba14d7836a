#include <storybase/Chain.hpp>

#include <storybase/check.hpp>
#include <storybase/log.hpp>

#include <chrono>
#include <exception>

namespace storybase
{
   Chain::Chain() = default;

   void Chain::addService(AccountNumber account, ServiceFactory factory)
   {
      std::lock_guard lock{mutex};
      check(account.value != 0, "Invalid service account");
      auto [it, inserted] = services.try_emplace(account, std::move(factory));
      check(inserted, "Service " + account.str() + " is already registered");
      STORYBASE_LOG_SERVICE(loggers::generic::get(), info, account) << "Registered service";
   }

   bool Chain::hasService(AccountNumber account) const
   {
      std::lock_guard lock{mutex};
      return services.contains(account);
   }

   // Only called from within a transaction, which already holds the mutex
   std::unique_ptr<ServiceBase> Chain::createService(const ActionContext& context) const
   {
      auto it = services.find(context.receiver);
      check(it != services.end(), "Service " + context.receiver.str() + " does not exist");
      return it->second(context);
   }

   TransactionTrace Chain::pushTransaction(AccountNumber          sender,
                                           AccountNumber          service,
                                           std::string            method,
                                           const TransactionBody& body)
   {
      std::lock_guard lock{mutex};

      TransactionTrace trace;
      trace.sender  = sender;
      trace.service = service;
      trace.method  = std::move(method);

      auto start = std::chrono::steady_clock::now();
      {
         auto               session = db.startWrite();
         TransactionContext trx{*this, db, trace};
         try
         {
            check(sender.value != 0, "Transaction sender is the null account");
            body(trx);
            session.commit();
         }
         catch (const AbortError& e)
         {
            trace.error     = e.what();
            trace.errorCode = e.code();
         }
         catch (const std::exception& e)
         {
            trace.error = e.what();
         }
      }
      trace.elapsed = std::chrono::steady_clock::now() - start;
      ++transactionCount;

      if (trace.error)
      {
         trace.events.clear();
         trace.returnValue.reset();
         STORYBASE_LOG_SERVICE(loggers::generic::get(), info, service)
             << sender.str() << " " << trace.method << " failed: " << *trace.error;
      }
      else
      {
         STORYBASE_LOG_SERVICE(loggers::generic::get(), debug, service)
             << sender.str() << " " << trace.method << " succeeded with "
             << trace.events.size() << " events";
         for (const auto& event : trace.events)
         {
            STORYBASE_LOG_SERVICE(loggers::generic::get(), debug, event.service)
                << prettyEvent(event);
         }
      }
      return trace;
   }
}  // namespace storybase
