#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace storybase
{
   /// An error with a numeric code that is reported to the caller verbatim
   struct ErrorCode
   {
      std::uint32_t    code;
      std::string_view message;

      std::string str() const { return std::to_string(code) + " " + std::string(message); }

      friend bool operator==(const ErrorCode& a, const ErrorCode& b) { return a.code == b.code; }
   };

   /// Thrown when an action aborts
   ///
   /// The transaction that is executing the action is rolled back
   /// and `what()` is recorded in its trace.
   class AbortError : public std::runtime_error
   {
     public:
      explicit AbortError(const std::string& message) : std::runtime_error(message) {}
      explicit AbortError(const ErrorCode& err) : std::runtime_error(err.str()), _code(err.code)
      {
      }

      std::optional<std::uint32_t> code() const { return _code; }

     private:
      std::optional<std::uint32_t> _code;
   };

   /// Abort with `message`
   ///
   /// Message should be UTF8.
   [[noreturn]] inline void abortMessage(std::string_view message)
   {
      throw AbortError((std::string)message);
   }

   /// Abort with a numbered error
   [[noreturn]] inline void abortMessage(const ErrorCode& err)
   {
      throw AbortError(err);
   }

   /// Abort with message if `!cond`
   ///
   /// Message should be UTF8.
   inline void check(bool cond, std::string_view message)
   {
      if (!cond)
         abortMessage(message);
   }

   /// Abort with `err` if `!cond`
   inline void check(bool cond, const ErrorCode& err)
   {
      if (!cond)
         abortMessage(err);
   }
}  // namespace storybase
