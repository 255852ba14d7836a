#include <storybase/Database.hpp>

#include <storybase/check.hpp>

namespace storybase
{
   Database::WriteSession::WriteSession(Database& db) : db(db)
   {
      check(db.session == nullptr, "A write session is already active");
      db.session = this;
   }

   Database::WriteSession::~WriteSession()
   {
      if (!committed)
      {
         for (auto it = undo.rbegin(); it != undo.rend(); ++it)
         {
            if (it->second)
               db.data.insert_or_assign(it->first, std::move(*it->second));
            else
               db.data.erase(it->first);
         }
      }
      db.session = nullptr;
   }

   void Database::WriteSession::commit()
   {
      committed = true;
      undo.clear();
   }

   const std::any* Database::get(const KeyBytes& key) const
   {
      auto it = data.find(key);
      if (it == data.end())
         return nullptr;
      return &it->second;
   }

   void Database::put(const KeyBytes& key, std::any value)
   {
      recordUndo(key);
      data.insert_or_assign(key, std::move(value));
   }

   void Database::remove(const KeyBytes& key)
   {
      recordUndo(key);
      data.erase(key);
   }

   Database::iterator Database::upperBoundPrefix(const KeyBytes& prefix) const
   {
      auto upper = prefixUpperBound(prefix);
      if (upper.empty())
         return data.end();
      return data.lower_bound(upper);
   }

   void Database::recordUndo(const KeyBytes& key)
   {
      check(session != nullptr, "Database write outside of a write session");
      check(!session->committed, "Write session already committed");
      auto it = data.find(key);
      if (it == data.end())
         session->undo.emplace_back(key, std::nullopt);
      else
         session->undo.emplace_back(key, it->second);
   }
}  // namespace storybase
