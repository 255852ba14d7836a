#pragma once

#include <storybase/AccountNumber.hpp>
#include <storybase/ActionContext.hpp>
#include <storybase/Table.hpp>
#include <storybase/TransactionContext.hpp>
#include <storybase/trace.hpp>

#include <string>
#include <utility>
#include <vector>

namespace storybase
{
   /// Records history events for the service that is running
   class EventEmitter
   {
     public:
      EventEmitter(TransactionContext& transaction, AccountNumber service)
          : transaction(&transaction), service(service)
      {
      }

      void history(std::string type, std::vector<EventField> fields) const
      {
         transaction->emitEvent(Event{service, std::move(type), std::move(fields)});
      }

     private:
      TransactionContext* transaction;
      AccountNumber       service;
   };

   /// Services inherit from this
   ///
   /// `Derived` must define `Tables`, a [ServiceTables] listing the tables
   /// it owns, and usually `service`, the account it is registered under.
   template <typename Derived>
   class Service : public ServiceBase
   {
     public:
      explicit Service(const ActionContext& context) : context(context) {}

      /// The account or service that called the current action
      AccountNumber getSender() const { return context.sender; }

      /// The service that is running the current action
      AccountNumber getReceiver() const { return context.receiver; }

      /// The account that signed the transaction
      ///
      /// This is the same as [getSender] for top-level actions. For nested
      /// calls it is still the account that pushed the transaction.
      AccountNumber getTransactionSender() const { return context.transaction->getSigner(); }

      /// Call another service; the callee sees this service as its sender
      template <typename Other>
      Actor<Other> to(AccountNumber receiver) const
      {
         ActionContext callee{context.transaction, getReceiver(), receiver, {}};
         return Actor<Other>(context.transaction->createService(callee));
      }

      template <typename Other>
         requires requires { Other::service; }
      Actor<Other> to() const
      {
         return to<Other>(Other::service);
      }

      /// Call this service's own actions as a nested call
      Actor<Derived> recurse() const { return to<Derived>(getReceiver()); }

      EventEmitter emit() const { return EventEmitter{*context.transaction, getReceiver()}; }

     protected:
      Database& database() const { return context.transaction->database(); }

      /// Opens this service's tables
      auto tables() const { return typename Derived::Tables{database(), getReceiver()}; }

     private:
      ActionContext context;
   };
}  // namespace storybase
