#include <storybase/tester.hpp>

#include <storybase/log.hpp>


storybase::TestChain::TestChain()
{
   loggers::configure(loggers::level::warning);
}

storybase::TestChain::~TestChain() = default;

storybase::TraceResult::TraceResult(TransactionTrace&& t) : _t(std::move(t)) {}

bool storybase::TraceResult::succeeded()
{
   bool failed = _t.error.has_value();
   if (failed)
   {
      UNSCOPED_INFO("transaction failed: " << *_t.error << "\n");
   }

   return !failed;
}

bool storybase::TraceResult::failed(std::string_view expected)
{
   bool failed = (_t.error != std::nullopt);
   if (!failed)
   {
      UNSCOPED_INFO("transaction succeeded, but was expected to fail");
      return false;
   }

   if (_t.error->find(expected) != std::string::npos)
   {
      return true;
   }
   else
   {
      UNSCOPED_INFO("transaction was expected to fail with: \""
                    << expected << "\", but it failed with: \"" << *_t.error << "\"\n");
   }

   return false;
}

bool storybase::TraceResult::failed(const ErrorCode& expected)
{
   if (!failed(expected.message))
      return false;

   if (_t.errorCode != expected.code)
   {
      UNSCOPED_INFO("transaction was expected to fail with code "
                    << expected.code << ", but its code was "
                    << (_t.errorCode ? std::to_string(*_t.errorCode) : std::string("none")));
      return false;
   }
   return true;
}
