#pragma once

#include <storybase/AccountNumber.hpp>
#include <storybase/check.hpp>

#include <memory>
#include <string>
#include <utility>

namespace storybase
{
   class TransactionContext;

   /// Identifies the action a service instance is running for
   ///
   /// `sender` is the account (or service) that called the action and
   /// `receiver` is the service that runs it. `method` is only set for
   /// actions that were pushed by name; nested calls leave it empty.
   struct ActionContext
   {
      TransactionContext* transaction = nullptr;
      AccountNumber       sender;
      AccountNumber       receiver;
      std::string         method;
   };

   /// Base of every service class
   ///
   /// The chain creates a fresh instance for every action, so services keep
   /// all of their state in tables.
   class ServiceBase
   {
     public:
      virtual ~ServiceBase() = default;
   };

   /// Holds a service instance that was created to handle a call
   ///
   /// `T` may be the service class itself or an interface the service
   /// implements.
   template <typename T>
   class Actor
   {
     public:
      explicit Actor(std::unique_ptr<ServiceBase> instance) : instance(std::move(instance))
      {
         service = dynamic_cast<T*>(this->instance.get());
         check(service != nullptr, "Service does not implement the requested interface");
      }

      T* operator->() const { return service; }
      T& operator*() const { return *service; }

     private:
      std::unique_ptr<ServiceBase> instance;
      T*                           service = nullptr;
   };
}  // namespace storybase
