#define CATCH_CONFIG_MAIN

#include <services/system/Genesis.hpp>
#include <services/system/commonErrors.hpp>
#include <services/user/Nft.hpp>
#include <services/user/StoryNft.hpp>
#include <services/user/Tokens.hpp>
#include <storybase/DefaultTestChain.hpp>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using namespace storybase;
using namespace UserService;
using namespace UserService::Errors;
using std::nullopt;
using std::string;
using std::vector;

namespace
{
   using Cid = vector<std::uint8_t>;

   const Cid audio(64, 0x11);
   const Cid image(64, 0x22);

   Quantity balanceOf(TestChain& t, AccountNumber account)
   {
      return t.from(account).to<Tokens>().call(&Tokens::getBalance, account).returnVal();
   }

   StoryId lastTokenId(TestChain& t)
   {
      return t.from(StoryNft::service)
          .to<StoryNft>()
          .call(&StoryNft::getLastTokenId)
          .returnVal();
   }

   string repeat(std::string_view s, std::size_t n)
   {
      string result;
      for (std::size_t i = 0; i < n; ++i)
         result += s;
      return result;
   }

   bool hasEvent(const TransactionTrace& trace, AccountNumber service, std::string_view type)
   {
      return std::any_of(trace.events.begin(), trace.events.end(), [&](const Event& e)
                         { return e.service == service && e.type == type; });
   }
}  // namespace

SCENARIO("Minting stories")
{
   GIVEN("A chain with creator Alice")
   {
      DefaultTestChain t;

      auto alice = t.from(t.addAccount("alice"_a));
      auto a     = alice.to<StoryNft>();

      THEN("No story has been minted")
      {
         CHECK(lastTokenId(t) == 0);
         CHECK(a.call(&StoryNft::getStoryDetails, 1).returnVal() == nullopt);
         CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == nullopt);
      }
      THEN("Alice can mint a story")
      {
         auto mint =
             a.call(&StoryNft::mint, "Test Story", "A test story description", audio, image, 10);
         REQUIRE(mint.succeeded());
         CHECK(mint.returnVal() == 1);
         CHECK(lastTokenId(t) == 1);

         AND_THEN("The story has exactly the minted fields")
         {
            auto story = a.call(&StoryNft::getStoryDetails, 1).returnVal();
            REQUIRE(story.has_value());

            StoryRecord expected{
                .id             = 1,
                .title          = "Test Story",
                .description    = "A test story description",
                .audioCid       = audio,
                .imageCid       = image,
                .creator        = alice.id,
                .royaltyPercent = 10,
            };
            CHECK(*story == expected);
         }
         AND_THEN("Alice owns the story")
         {
            CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == alice.id);

            CHECK(alice.to<Nft>().call(&Nft::getNft, StoryNft::service, 1).returnVal()->owner ==
                  alice.id);
         }
         AND_THEN("The story service and the ledger both emitted minted events")
         {
            CHECK(hasEvent(mint.trace(), StoryNft::service, "minted"));
            CHECK(hasEvent(mint.trace(), Nft::service, "minted"));
         }
      }
      THEN("A mint the ledger rejects leaves no story behind")
      {
         auto ghost = t.from("ghost"_a).to<StoryNft>();
         CHECK(ghost.call(&StoryNft::mint, "Ghost Story", "", audio, image, 10)
                   .failed(invalidAccount));
         CHECK(lastTokenId(t) == 0);
         CHECK(a.call(&StoryNft::getStoryDetails, 1).returnVal() == nullopt);
         CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == nullopt);

         AND_THEN("The next mint still gets id 1")
         {
            CHECK(a.call(&StoryNft::mint, "Story", "", audio, image, 10).returnVal() == 1);
         }
      }
      THEN("Each mint takes the next id")
      {
         for (StoryId expected = 1; expected <= 5; ++expected)
         {
            auto mint = a.call(&StoryNft::mint, "Story", "", Cid{}, Cid{}, 0);
            CHECK(mint.returnVal() == expected);
            CHECK(lastTokenId(t) == expected);
         }
      }
      THEN("An empty title is rejected")
      {
         auto mint = a.call(&StoryNft::mint, "", "A test story description", audio, image, 10);
         CHECK(mint.failed(invalidStory));
         CHECK(mint.trace().errorCode == 400u);
         CHECK(mint.trace().events.empty());
         CHECK(lastTokenId(t) == 0);
      }
      THEN("Titles are limited to 100 characters")
      {
         CHECK(a.call(&StoryNft::mint, repeat("A", 101), "", audio, image, 10)
                   .failed(invalidStory));
         CHECK(lastTokenId(t) == 0);
         CHECK(a.call(&StoryNft::mint, repeat("A", 100), "", audio, image, 10).succeeded());
      }
      THEN("Lengths are counted in characters, not bytes")
      {
         CHECK(a.call(&StoryNft::mint, repeat("\xc3\xa9", 100), "", audio, image, 10).succeeded());
         CHECK(a.call(&StoryNft::mint, repeat("\xc3\xa9", 101), "", audio, image, 10)
                   .failed(invalidStory));
         CHECK(a.call(&StoryNft::mint, "Story", repeat("\xe6\x95\x85", 500), audio, image, 10)
                   .succeeded());
      }
      THEN("Descriptions are limited to 500 characters")
      {
         CHECK(a.call(&StoryNft::mint, "Story", repeat("B", 501), audio, image, 10)
                   .failed(invalidStory));
      }
      THEN("The maximum lengths are accepted")
      {
         CHECK(
             a.call(&StoryNft::mint, repeat("A", 100), repeat("B", 500), audio, image, 10)
                 .succeeded());
         CHECK(lastTokenId(t) == 1);
      }
      THEN("Text must be valid UTF-8")
      {
         CHECK(a.call(&StoryNft::mint, "Bad \xff title", "", audio, image, 10)
                   .failed(invalidStory));
         CHECK(a.call(&StoryNft::mint, "Story", "Bad \xc3 description", audio, image, 10)
                   .failed(invalidStory));
      }
      THEN("Content ids are limited to 64 bytes")
      {
         CHECK(a.call(&StoryNft::mint, "Story", "", Cid(65, 1), image, 10).failed(invalidStory));
         CHECK(a.call(&StoryNft::mint, "Story", "", audio, Cid(65, 2), 10).failed(invalidStory));
      }
      THEN("The royalty is at most 100 percent")
      {
         CHECK(a.call(&StoryNft::mint, "Story", "", audio, image, 101).failed(invalidStory));
         CHECK(a.call(&StoryNft::mint, "Story", "", audio, image, 255).failed(invalidStory));
         CHECK(a.call(&StoryNft::mint, "Story", "", audio, image, 256).failed(invalidStory));
         CHECK(lastTokenId(t) == 0);
         CHECK(a.call(&StoryNft::mint, "Story", "", audio, image, 100).succeeded());
         CHECK(a.call(&StoryNft::mint, "Story", "", audio, image, 0).succeeded());
      }
   }
}

SCENARIO("Transferring stories")
{
   GIVEN("Alice minted story 1 with a 10% royalty")
   {
      DefaultTestChain t;

      auto alice   = t.from(t.addAccount("alice"_a));
      auto bob     = t.from(t.addAccount("bob"_a));
      auto charlie = t.from(t.addAccount("charlie"_a));

      auto a = alice.to<StoryNft>();
      auto b = bob.to<StoryNft>();
      auto c = charlie.to<StoryNft>();

      a.call(&StoryNft::mint, "Transferable Story", "A story to transfer", audio, image, 10);
      t.fund(alice, 1000);
      t.fund(bob, 1000);

      THEN("Alice can transfer it to Bob without paying herself a royalty")
      {
         auto transfer = a.call(&StoryNft::transfer, 1, alice, bob);
         REQUIRE(transfer.succeeded());
         CHECK(transfer.returnVal() == true);
         CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == bob.id);
         CHECK(balanceOf(t, alice) == 1000);
         CHECK(hasEvent(transfer.trace(), StoryNft::service, "transferred"));
         CHECK(!hasEvent(transfer.trace(), StoryNft::service, "royaltyPaid"));

         AND_THEN("Bob pays Alice 10% of his balance when he transfers it to Charlie")
         {
            auto transfer2 = b.call(&StoryNft::transfer, 1, bob, charlie);
            REQUIRE(transfer2.succeeded());
            CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == charlie.id);
            CHECK(balanceOf(t, bob) == 900);
            CHECK(balanceOf(t, alice) == 1100);
            CHECK(hasEvent(transfer2.trace(), StoryNft::service, "royaltyPaid"));
            CHECK(hasEvent(transfer2.trace(), Tokens::service, "transferred"));
         }
         AND_THEN("The royalty is rounded down")
         {
            bob.to<Tokens>().call(&Tokens::credit, charlie, 1, "");
            CHECK(b.call(&StoryNft::transfer, 1, bob, charlie).succeeded());
            CHECK(balanceOf(t, bob) == 999 - 99);
            CHECK(balanceOf(t, alice) == 1099);
         }
         AND_THEN("Bob owes no royalty when he holds no tokens")
         {
            bob.to<Tokens>().call(&Tokens::credit, charlie, 1000, "");
            CHECK(b.call(&StoryNft::transfer, 1, bob, charlie).succeeded());
            CHECK(balanceOf(t, alice) == 1000);
            CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == charlie.id);
         }
         AND_THEN("Alice can no longer transfer it")
         {
            CHECK(a.call(&StoryNft::transfer, 1, alice, charlie).failed(notNftOwner));
         }
      }
      THEN("Nobody else can transfer on Alice's behalf")
      {
         auto transfer = b.call(&StoryNft::transfer, 1, alice, charlie);
         CHECK(transfer.failed(unauthorized));
         CHECK(transfer.trace().errorCode == 403u);
         CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == alice.id);
      }
      THEN("The caller must be the sender even when it owns nothing")
      {
         CHECK(c.call(&StoryNft::transfer, 1, bob, charlie).failed(unauthorized));
      }
      THEN("Stories that were never minted cannot be transferred")
      {
         auto transfer = a.call(&StoryNft::transfer, 2, alice, bob);
         CHECK(transfer.failed(storyNotFound));
         CHECK(transfer.trace().errorCode == 404u);
      }
      THEN("A missing story is reported before a wrong caller")
      {
         CHECK(b.call(&StoryNft::transfer, 2, alice, bob).failed(storyNotFound));
      }
      THEN("Bob cannot transfer a story he does not hold")
      {
         CHECK(b.call(&StoryNft::transfer, 1, bob, charlie).failed(notNftOwner));
         CHECK(balanceOf(t, bob) == 1000);
         CHECK(balanceOf(t, alice) == 1000);
      }
      THEN("Ledger failures undo the whole transfer")
      {
         a.call(&StoryNft::transfer, 1, alice, bob);
         CHECK(b.call(&StoryNft::transfer, 1, bob, "nobody"_a).failed(invalidAccount));
         CHECK(b.call(&StoryNft::transfer, 1, bob, bob).failed(creditorIsDebitor));
         CHECK(balanceOf(t, bob) == 1000);
         CHECK(balanceOf(t, alice) == 1000);
         CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == bob.id);
      }
   }
}

SCENARIO("Tipping creators")
{
   GIVEN("Alice minted story 1 and Bob holds 1000 tokens")
   {
      DefaultTestChain t;

      auto alice = t.from(t.addAccount("alice"_a));
      auto bob   = t.from(t.addAccount("bob"_a));

      auto a = alice.to<StoryNft>();
      auto b = bob.to<StoryNft>();

      a.call(&StoryNft::mint, "Tippable Story", "A story to tip", audio, image, 10);
      t.fund(bob, 1000);

      THEN("Bob can tip Alice")
      {
         auto tip = b.call(&StoryNft::tip, 1, 100);
         REQUIRE(tip.succeeded());
         CHECK(tip.returnVal() == true);
         CHECK(balanceOf(t, alice) == 100);
         CHECK(balanceOf(t, bob) == 900);
         CHECK(hasEvent(tip.trace(), StoryNft::service, "tipped"));
      }
      THEN("A tip of zero is rejected")
      {
         auto tip = b.call(&StoryNft::tip, 1, 0);
         CHECK(tip.failed(insufficientFunds));
         CHECK(tip.trace().errorCode == 402u);
      }
      THEN("Bob cannot tip more than he holds")
      {
         CHECK(b.call(&StoryNft::tip, 1, 1001).failed(insufficientBalance));
         CHECK(balanceOf(t, bob) == 1000);
      }
      THEN("Alice cannot tip herself")
      {
         t.fund(alice, 10);
         CHECK(a.call(&StoryNft::tip, 1, 5).failed(senderIsReceiver));
      }
      THEN("Stories that were never minted cannot be tipped")
      {
         CHECK(b.call(&StoryNft::tip, 9, 100).failed(storyNotFound));
      }
      THEN("Tips do not change the story or its owner")
      {
         auto before = a.call(&StoryNft::getStoryDetails, 1).returnVal();
         b.call(&StoryNft::tip, 1, 100);
         CHECK(a.call(&StoryNft::getStoryDetails, 1).returnVal() == before);
         CHECK(a.call(&StoryNft::getOwner, 1).returnVal() == alice.id);
      }
   }
}

SCENARIO("Token metadata")
{
   GIVEN("A chain booted with the default configuration")
   {
      DefaultTestChain t;

      auto alice = t.from(t.addAccount("alice"_a)).to<StoryNft>();

      THEN("Every token has the default URI")
      {
         CHECK(alice.call(&StoryNft::getTokenUri, 1).returnVal() ==
               string(StoryNft::defaultTokenUri));
         CHECK(alice.call(&StoryNft::getTokenUri, 12345).returnVal() ==
               string(StoryNft::defaultTokenUri));
      }
      THEN("The service cannot be initialized again")
      {
         auto sys = t.from(StoryNft::service).to<StoryNft>();
         CHECK(sys.init(Nft::service, string("https://other.example")).failed(alreadyInit));
      }
   }
   GIVEN("A chain booted with a custom token URI")
   {
      DefaultTestChain t{SystemService::GenesisConfig{
          .accounts = {"alice"_a},
          .balances = {},
          .tokenUri = "ipfs://stories",
      }};

      auto alice = t.from("alice"_a).to<StoryNft>();

      THEN("Every token has the custom URI")
      {
         CHECK(alice.call(&StoryNft::getTokenUri, 1).returnVal() == string("ipfs://stories"));
      }
   }
}

SCENARIO("Using an uninitialized StoryNft service")
{
   GIVEN("A chain where StoryNft is registered but not initialized")
   {
      TestChain t;
      t.chain().registerService<StoryNft>();

      auto sys = t.from(StoryNft::service).to<StoryNft>();

      THEN("Actions fail")
      {
         CHECK(sys.call(&StoryNft::getLastTokenId).failed(uninitialized));
      }
   }
}

TEST_CASE("Royalty amounts")
{
   auto max = std::numeric_limits<Quantity::Quantity_t>::max();

   CHECK(StoryNft::royaltyOf(1000, 10) == 100);
   CHECK(StoryNft::royaltyOf(999, 10) == 99);
   CHECK(StoryNft::royaltyOf(9, 10) == 0);
   CHECK(StoryNft::royaltyOf(0, 100) == 0);
   CHECK(StoryNft::royaltyOf(1234, 0) == 0);
   CHECK(StoryNft::royaltyOf(1234, 100) == 1234);
   CHECK(StoryNft::royaltyOf(max, 100) == max);
   CHECK(StoryNft::royaltyOf(max, 50) == max / 2);
   CHECK(StoryNft::royaltyOf(max, 1) == max / 100);
   CHECK_THROWS_AS(StoryNft::royaltyOf(1, 101), AbortError);
}

SCENARIO("A story's life")
{
   GIVEN("Three accounts")
   {
      DefaultTestChain t;

      auto creator      = t.from(t.addAccount("creator"_a));
      auto tipper       = t.from(t.addAccount("tipper"_a));
      auto mallory      = t.from(t.addAccount("mallory"_a));
      t.fund(tipper, 1000);

      THEN("Minting, a rejected mint, an unauthorized transfer, and a tip behave as expected")
      {
         auto story = creator.to<StoryNft>();
         CHECK(story.call(&StoryNft::mint, "Test Story", "A test story description", audio,
                          image, 10)
                   .returnVal() == 1);
         CHECK(lastTokenId(t) == 1);

         CHECK(story.call(&StoryNft::mint, "", "A test story description", audio, image, 10)
                   .failed(invalidStory));
         CHECK(lastTokenId(t) == 1);

         CHECK(mallory.to<StoryNft>()
                   .call(&StoryNft::transfer, 1, creator, tipper)
                   .failed(unauthorized));

         CHECK(tipper.to<StoryNft>().call(&StoryNft::tip, 1, 100).succeeded());
         CHECK(balanceOf(t, creator) == 100);
         CHECK(balanceOf(t, tipper) == 900);
      }
   }
}
