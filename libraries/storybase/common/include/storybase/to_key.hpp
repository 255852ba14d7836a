#pragma once

#include <storybase/AccountNumber.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace storybase
{
   /// Key serialization
   ///
   /// Keys are encoded so that the lexicographic order of the encoded bytes
   /// matches the natural order of the values: unsigned integers are big-endian,
   /// signed integers have their sign bit flipped, strings are zero-terminated
   /// (with embedded zeros escaped as `\0\1`), and tuples are concatenated.
   using KeyBytes = std::vector<char>;

   /// Orders keys by their bytes as unsigned values, like memcmp
   struct KeyLess
   {
      bool operator()(const KeyBytes& a, const KeyBytes& b) const
      {
         return std::lexicographical_compare(
             a.begin(), a.end(), b.begin(), b.end(), [](char x, char y)
             { return static_cast<unsigned char>(x) < static_cast<unsigned char>(y); });
      }
   };

   template <std::unsigned_integral T>
   void to_key(T value, KeyBytes& out)
   {
      for (int shift = (sizeof(T) - 1) * 8; shift >= 0; shift -= 8)
         out.push_back(static_cast<char>((value >> shift) & 0xff));
   }

   template <std::signed_integral T>
   void to_key(T value, KeyBytes& out)
   {
      using U = std::make_unsigned_t<T>;
      to_key(static_cast<U>(static_cast<U>(value) ^ (U{1} << (sizeof(T) * 8 - 1))), out);
   }

   inline void to_key(bool value, KeyBytes& out)
   {
      out.push_back(value ? 1 : 0);
   }

   inline void to_key(std::string_view value, KeyBytes& out)
   {
      for (char c : value)
      {
         out.push_back(c);
         if (c == 0)
            out.push_back(1);
      }
      out.push_back(0);
      out.push_back(0);
   }

   inline void to_key(const std::string& value, KeyBytes& out)
   {
      to_key(std::string_view{value}, out);
   }

   inline void to_key(const AccountNumber& value, KeyBytes& out)
   {
      to_key(value.value, out);
   }

   template <typename... T>
   void to_key(const std::tuple<T...>& value, KeyBytes& out)
   {
      std::apply([&](const auto&... member) { (to_key(member, out), ...); }, value);
   }

   template <typename T>
   KeyBytes convert_to_key(const T& value)
   {
      KeyBytes result;
      to_key(value, result);
      return result;
   }

   /// Returns the smallest key that is greater than every key starting with `prefix`
   ///
   /// Returns an empty vector when no such key exists (the prefix is all 0xff).
   inline KeyBytes prefixUpperBound(KeyBytes prefix)
   {
      while (!prefix.empty())
      {
         auto& last = reinterpret_cast<unsigned char&>(prefix.back());
         if (last != 0xff)
         {
            ++last;
            return prefix;
         }
         prefix.pop_back();
      }
      return prefix;
   }
}  // namespace storybase
