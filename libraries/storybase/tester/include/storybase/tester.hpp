#pragma once
#include <catch2/catch.hpp>
#include <iostream>
#include <storybase/Chain.hpp>
#include <storybase/check.hpp>
#include <storybase/trace.hpp>

#include <any>
#include <string>
#include <string_view>
#include <utility>

namespace storybase
{
   inline std::string show(bool include, const TransactionTrace& t)
   {
      if (include || t.error)
         std::cout << prettyTrace(t) << "\n";
      if (t.error)
         return *t.error;
      return {};
   }

   class TraceResult
   {
     public:
      TraceResult(TransactionTrace&& t);
      bool succeeded();
      bool failed(std::string_view expected);

      /// Also requires the numeric code to match
      bool failed(const ErrorCode& expected);

      const TransactionTrace& trace() { return _t; }

     protected:
      TransactionTrace _t;
   };

   template <typename ReturnType>
   class Result : public TraceResult
   {
     public:
      Result(TransactionTrace&& t) : TraceResult(std::move(t)) {}

      ReturnType returnVal()
      {
         if (_t.error.has_value())
         {
            std::cout << prettyTrace(_t).c_str();
         }

         auto value = std::any_cast<ReturnType>(&_t.returnValue);
         check(value != nullptr, "Action aborted, no return value");
         return *value;
      }
   };

   template <>
   class Result<void> : public TraceResult
   {
     public:
      Result(TransactionTrace&& t) : TraceResult(std::move(t)) {}
   };

   /**
    * Manages a chain.
    *
    * The chain starts out without any services. Console logging is limited
    * to warnings so that test output stays readable.
    */
   class TestChain
   {
     public:
      TestChain();
      virtual ~TestChain();

      TestChain(const TestChain&)            = delete;
      TestChain& operator=(const TestChain&) = delete;

      Chain& chain() { return _chain; }

      /// Pushes a transaction that runs one action of `Service`
      template <typename Service, typename F>
      auto pushAction(AccountNumber sender, AccountNumber service, std::string method, F&& fn)
      {
         using R = std::invoke_result_t<F&, Service&>;
         return Result<R>(
             _chain.pushAction<Service>(sender, service, std::move(method), std::forward<F>(fn)));
      }

      template <typename Service>
      struct ServiceUser
      {
         TestChain&    t;
         AccountNumber sender;
         AccountNumber service;

         /// Calls `method` on a fresh instance of the service
         ///
         /// e.g. `alice.to<Tokens>().call(&Tokens::credit, bob, 100, "memo")`
         template <typename R, typename... Params, typename... Args>
         Result<R> call(R (Service::*method)(Params...), Args&&... args) const
         {
            return t.pushAction<Service>(sender, service, {},
                                         [&](Service& s) -> R
                                         { return (s.*method)(std::forward<Args>(args)...); });
         }

         /// Calls the service's `init` action
         template <typename... Args>
         auto init(Args&&... args) const
         {
            return t.pushAction<Service>(sender, service, "init",
                                         [&](Service& s)
                                         { return s.init(std::forward<Args>(args)...); });
         }
      };

      struct UserContext
      {
         TestChain&    t;
         AccountNumber id;

         template <typename Other>
         auto to() const
         {
            return ServiceUser<Other>{t, id, Other::service};
         }

         template <typename Other>
         auto to(AccountNumber service) const
         {
            return ServiceUser<Other>{t, id, service};
         }

         operator AccountNumber() const { return id; }
      };

      auto from(AccountNumber id) { return UserContext{*this, id}; }

     private:
      Chain _chain;
   };
}  // namespace storybase
