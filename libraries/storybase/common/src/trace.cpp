#include <storybase/trace.hpp>

#include <sstream>

namespace storybase
{
   std::string prettyEvent(const Event& event)
   {
      std::ostringstream os;
      os << event.service << "::" << event.type << " {";
      bool first = true;
      for (const auto& [name, value] : event.fields)
      {
         os << (first ? " " : ", ") << name << ": " << value;
         first = false;
      }
      os << (first ? "}" : " }");
      return os.str();
   }

   std::string prettyTrace(const TransactionTrace& trace)
   {
      std::ostringstream os;
      os << trace.sender << " => " << trace.service;
      if (!trace.method.empty())
         os << "::" << trace.method;
      if (trace.error)
         os << " failed: " << *trace.error;
      else
         os << " succeeded";
      os << " ("
         << std::chrono::duration_cast<std::chrono::microseconds>(trace.elapsed).count()
         << " us)\n";
      for (const auto& event : trace.events)
         os << "    " << prettyEvent(event) << "\n";
      return os.str();
   }
}  // namespace storybase
