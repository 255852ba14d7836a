#pragma once

#include <storybase/AccountNumber.hpp>
#include <storybase/Database.hpp>
#include <storybase/check.hpp>
#include <storybase/to_key.hpp>

#include <boost/mp11/algorithm.hpp>
#include <boost/mp11/list.hpp>

#include <any>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <tuple>
#include <type_traits>

namespace storybase
{
   /// Key extractor for tables which hold at most one row
   struct SingletonKey
   {
      constexpr std::tuple<> operator()(const auto&) const { return {}; }
   };

   namespace detail
   {
      template <auto Key, typename T>
      using key_of = std::remove_cvref_t<decltype(std::invoke(Key, std::declval<const T&>()))>;
   }

   /// A primary index over the rows of a [Table]
   ///
   /// Iterators visit rows in key order. They are invalidated by any
   /// write to the table.
   template <typename T, typename K>
   class TableIndex
   {
     public:
      class iterator
      {
        public:
         using iterator_category = std::bidirectional_iterator_tag;
         using value_type        = T;
         using difference_type   = std::ptrdiff_t;
         using pointer           = const T*;
         using reference         = const T&;

         iterator() = default;
         explicit iterator(Database::iterator it) : it(it) {}

         const T& operator*() const { return std::any_cast<const T&>(it->second); }
         const T* operator->() const { return &**this; }

         iterator& operator++()
         {
            ++it;
            return *this;
         }
         iterator operator++(int)
         {
            auto copy = *this;
            ++it;
            return copy;
         }
         iterator& operator--()
         {
            --it;
            return *this;
         }
         iterator operator--(int)
         {
            auto copy = *this;
            --it;
            return copy;
         }

         friend bool operator==(const iterator&, const iterator&) = default;

        private:
         Database::iterator it;
      };

      TableIndex(const Database& db, KeyBytes prefix) : db(&db), prefix(std::move(prefix)) {}

      /// Look up a row by key
      std::optional<T> get(const K& key) const
      {
         auto value = db->get(keyOf(key));
         if (!value)
            return std::nullopt;
         return std::any_cast<const T&>(*value);
      }

      iterator begin() const { return iterator{db->lowerBound(prefix)}; }
      iterator end() const { return iterator{db->upperBoundPrefix(prefix)}; }
      bool     empty() const { return begin() == end(); }

      std::optional<T> first() const
      {
         if (empty())
            return std::nullopt;
         return *begin();
      }

      std::optional<T> last() const
      {
         if (empty())
            return std::nullopt;
         return *--end();
      }

      KeyBytes keyOf(const K& key) const
      {
         auto result = prefix;
         to_key(key, result);
         return result;
      }

     private:
      const Database* db;
      KeyBytes        prefix;
   };

   /// Stores rows of `T` in the database, keyed by `Primary`
   ///
   /// `Primary` may be a pointer to a data member, a pointer to a const
   /// member function, or a callable object such as [SingletonKey].
   ///
   /// Rows are stored under `prefix + to_key(primary key)`. The prefix
   /// is assigned by [ServiceTables] and separates tables from each other.
   template <typename T, auto Primary>
   class Table
   {
     public:
      using key_type   = detail::key_of<Primary, T>;
      using value_type = T;

      Table(Database& db, KeyBytes prefix) : db(&db), prefix(std::move(prefix)) {}

      /// Store `value` into the table
      ///
      /// If a row already exists with the same primary key, then the new
      /// row replaces it.
      void put(const T& value) { db->put(getIndex<0>().keyOf(std::invoke(Primary, value)), value); }

      /// Remove `key` from the table
      void erase(const key_type& key) { db->remove(getIndex<0>().keyOf(key)); }

      /// Remove a row from the table
      void remove(const T& oldValue) { erase(std::invoke(Primary, oldValue)); }

      /// Get the primary index
      template <int Idx>
      auto getIndex() const
      {
         static_assert(Idx == 0, "Only the primary index is supported");
         return TableIndex<T, key_type>(*db, prefix);
      }

      std::optional<T> get(const key_type& key) const { return getIndex<0>().get(key); }

      std::optional<T> first() const { return getIndex<0>().first(); }
      std::optional<T> last() const { return getIndex<0>().last(); }

     private:
      Database* db;
      KeyBytes  prefix;
   };

   /// The set of tables owned by a service
   ///
   /// Table `i` in the list is stored under the prefix
   /// `to_key(service) + to_key(uint16_t{i})`.
   ///
   /// e.g. `auto table = MyServiceTables{db, myServiceAccount}.open<MyTable>();`
   template <typename... Tables>
   class ServiceTables
   {
     public:
      ServiceTables(Database& db, AccountNumber account) : db(&db), account(account) {}

      template <std::uint16_t i>
      auto open() const
      {
         using table = boost::mp11::mp_at_c<boost::mp11::mp_list<Tables...>, i>;
         KeyBytes prefix;
         to_key(account, prefix);
         to_key(i, prefix);
         return table(*db, std::move(prefix));
      }

      template <typename T>
         requires(std::is_same_v<T, Tables> || ...)
      auto open() const
      {
         constexpr auto i = boost::mp11::mp_find<boost::mp11::mp_list<Tables...>, T>::value;
         return open<static_cast<std::uint16_t>(i)>();
      }

     private:
      Database*     db;
      AccountNumber account;
   };
}  // namespace storybase
