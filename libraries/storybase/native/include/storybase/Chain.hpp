#pragma once

#include <storybase/ActionContext.hpp>
#include <storybase/Database.hpp>
#include <storybase/TransactionContext.hpp>
#include <storybase/trace.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

namespace storybase
{
   /// Hosts the services and their database
   ///
   /// Every action runs as its own transaction. Transactions are serialized
   /// by a single mutex, and a transaction either commits all of its writes
   /// or none of them.
   class Chain
   {
     public:
      using ServiceFactory  = std::function<std::unique_ptr<ServiceBase>(const ActionContext&)>;
      using TransactionBody = std::function<void(TransactionContext&)>;

      Chain();
      Chain(const Chain&)            = delete;
      Chain& operator=(const Chain&) = delete;

      template <typename T>
      void registerService(AccountNumber account = T::service)
      {
         addService(account,
                    [](const ActionContext& context) -> std::unique_ptr<ServiceBase>
                    { return std::make_unique<T>(context); });
      }

      void addService(AccountNumber account, ServiceFactory factory);
      bool hasService(AccountNumber account) const;

      /// Creates an instance of `context.receiver`; aborts if it isn't registered
      std::unique_ptr<ServiceBase> createService(const ActionContext& context) const;

      /// Runs `body` as a transaction signed by `sender`
      TransactionTrace pushTransaction(AccountNumber          sender,
                                       AccountNumber          service,
                                       std::string            method,
                                       const TransactionBody& body);

      /// Runs `fn(instance)` as a transaction, where `instance` is a fresh
      /// `T` that handles an action sent by `sender` to `service`. The
      /// return value of `fn`, if any, is stored in the trace.
      template <typename T, typename F>
      TransactionTrace pushAction(AccountNumber sender,
                                  AccountNumber service,
                                  std::string   method,
                                  F&&           fn)
      {
         return pushTransaction(sender, service, method,
                                [&](TransactionContext& trx)
                                {
                                   ActionContext context{&trx, sender, service, method};
                                   Actor<T>      actor{trx.createService(context)};
                                   using R = std::invoke_result_t<F&, T&>;
                                   if constexpr (std::is_void_v<R>)
                                      fn(*actor);
                                   else
                                      trx.transactionTrace.returnValue = fn(*actor);
                                });
      }

      template <typename T, typename F>
      TransactionTrace pushAction(AccountNumber sender, std::string method, F&& fn)
      {
         return pushAction<T>(sender, T::service, std::move(method), std::forward<F>(fn));
      }

      const Database& database() const { return db; }
      std::uint64_t   numTransactions() const { return transactionCount; }

     private:
      mutable std::mutex                      mutex;
      Database                                db;
      std::map<AccountNumber, ServiceFactory> services;
      std::uint64_t                           transactionCount = 0;
   };
}  // namespace storybase
