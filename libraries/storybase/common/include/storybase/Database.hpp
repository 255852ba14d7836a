#pragma once

#include <storybase/to_key.hpp>

#include <any>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace storybase
{
   /// In-memory key-value store shared by all services
   ///
   /// Keys are byte strings produced by [to_key]; values are the records
   /// themselves. All writes must happen inside a [Database::WriteSession];
   /// a session that is destroyed without [WriteSession::commit] undoes every
   /// write made through it.
   class Database
   {
     public:
      using Map      = std::map<KeyBytes, std::any, KeyLess>;
      using iterator = Map::const_iterator;

      class WriteSession
      {
        public:
         explicit WriteSession(Database& db);
         WriteSession(const WriteSession&)            = delete;
         WriteSession& operator=(const WriteSession&) = delete;
         ~WriteSession();

         void        commit();
         std::size_t numChanges() const { return undo.size(); }

        private:
         friend class Database;

         Database& db;
         bool      committed = false;

         // previous value of each written key, in write order
         std::vector<std::pair<KeyBytes, std::optional<std::any>>> undo;
      };

      Database()                           = default;
      Database(const Database&)            = delete;
      Database& operator=(const Database&) = delete;

      WriteSession startWrite() { return WriteSession{*this}; }
      bool         inSession() const { return session != nullptr; }

      const std::any* get(const KeyBytes& key) const;
      void            put(const KeyBytes& key, std::any value);
      void            remove(const KeyBytes& key);

      iterator lowerBound(const KeyBytes& key) const { return data.lower_bound(key); }
      iterator upperBoundPrefix(const KeyBytes& prefix) const;
      iterator end() const { return data.end(); }

      std::size_t size() const { return data.size(); }

     private:
      void recordUndo(const KeyBytes& key);

      Map           data;
      WriteSession* session = nullptr;
   };
}  // namespace storybase
