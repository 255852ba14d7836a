#include <catch2/catch.hpp>

#include <storybase/Database.hpp>
#include <storybase/Table.hpp>
#include <storybase/check.hpp>

#include <string>
#include <tuple>
#include <vector>

using namespace storybase;

namespace
{
   struct Item
   {
      std::uint64_t id;
      std::string   name;

      auto operator<=>(const Item&) const = default;
   };
   using ItemTable = Table<Item, &Item::id>;

   struct Settings
   {
      std::uint32_t limit = 0;

      std::tuple<> key() const { return {}; }
   };
   using SettingsTable = Table<Settings, &Settings::key>;

   using TestTables = ServiceTables<ItemTable, SettingsTable>;
}  // namespace

TEST_CASE("write sessions")
{
   Database db;
   auto     key = convert_to_key(std::string("key"));

   CHECK_THROWS_AS(db.put(key, 1), AbortError);
   CHECK(db.get(key) == nullptr);

   SECTION("committed writes are kept")
   {
      {
         auto session = db.startWrite();
         db.put(key, 1);
         session.commit();
      }
      REQUIRE(db.get(key) != nullptr);
      CHECK(std::any_cast<int>(*db.get(key)) == 1);
      CHECK(!db.inSession());
   }

   SECTION("uncommitted writes are undone")
   {
      {
         auto session = db.startWrite();
         db.put(key, 1);
         session.commit();
      }
      {
         auto session = db.startWrite();
         db.put(key, 2);
         db.put(convert_to_key(std::string("other")), 3);
         db.remove(key);
         db.put(key, 4);
         CHECK(session.numChanges() == 4);
      }
      REQUIRE(db.get(key) != nullptr);
      CHECK(std::any_cast<int>(*db.get(key)) == 1);
      CHECK(db.get(convert_to_key(std::string("other"))) == nullptr);
      CHECK(db.size() == 1);
   }

   SECTION("only one session at a time")
   {
      auto session = db.startWrite();
      CHECK_THROWS_AS(db.startWrite(), AbortError);
   }
}

TEST_CASE("tables")
{
   Database db;
   auto     session = db.startWrite();

   auto tables = TestTables{db, AccountNumber{"alice"}};
   auto items  = tables.open<ItemTable>();

   CHECK(items.getIndex<0>().empty());
   CHECK(items.first() == std::nullopt);

   items.put({.id = 300, .name = "c"});
   items.put({.id = 1, .name = "a"});
   items.put({.id = 20, .name = "b"});

   std::vector<std::uint64_t> ids;
   for (const auto& item : items.getIndex<0>())
      ids.push_back(item.id);
   CHECK(ids == std::vector<std::uint64_t>{1, 20, 300});

   CHECK(items.get(20) == Item{20, "b"});
   CHECK(items.get(21) == std::nullopt);
   CHECK(items.first()->id == 1);
   CHECK(items.last()->id == 300);

   items.put({.id = 20, .name = "replaced"});
   CHECK(items.get(20)->name == "replaced");

   items.erase(1);
   CHECK(items.get(1) == std::nullopt);
   items.remove(Item{300, "c"});
   CHECK(items.first()->id == 20);
   CHECK(items.last()->id == 20);

   SECTION("tables of one service do not overlap")
   {
      auto settings = tables.open<SettingsTable>();
      settings.put({.limit = 5});
      CHECK(settings.get(std::tuple{})->limit == 5);
      CHECK(items.last()->id == 20);
   }

   SECTION("services do not see each other's rows")
   {
      auto bobItems = TestTables{db, AccountNumber{"bob"}}.open<ItemTable>();
      CHECK(bobItems.getIndex<0>().empty());
      bobItems.put({.id = 1, .name = "bob's"});
      CHECK(items.get(1) == std::nullopt);
      CHECK(bobItems.get(1)->name == "bob's");
   }
}
