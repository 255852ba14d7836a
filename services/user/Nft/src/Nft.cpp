#include <services/user/Nft.hpp>

#include <services/system/Accounts.hpp>
#include <services/system/commonErrors.hpp>

#include <string>

using namespace storybase;
using namespace UserService;
using namespace Errors;
using std::nullopt;
using std::optional;
using SystemService::Accounts;

Nft::Nft(const ActionContext& context) : Service(context)
{
   if (context.method != "init")
   {
      auto initRecord = tables().open<InitTable>().get(std::tuple{});
      check(initRecord.has_value(), uninitialized);
   }
}

void Nft::init()
{
   auto initTable = tables().open<InitTable>();
   auto init      = (initTable.get(std::tuple{}));
   check(not init.has_value(), alreadyInit);
   initTable.put(InitializedRecord{});
}

void Nft::mint(NID nftId, AccountNumber owner)
{
   auto issuer   = getSender();
   auto nftTable = tables().open<NftTable>();

   check(NftRecord::isValidKey(nftId), invalidNftId);
   check(not nftTable.get(std::tuple{issuer, nftId}).has_value(), nftAlreadyMinted);
   checkAccountValid(owner);

   auto newRecord = NftRecord{
       .issuer = issuer,  //
       .id     = nftId,   //
       .owner  = owner    //
   };
   nftTable.put(newRecord);

   emit().history("minted", {{"issuer", issuer.str()},
                             {"nftId", std::to_string(nftId)},
                             {"owner", owner.str()}});
}

void Nft::transfer(NID nftId, AccountNumber from, AccountNumber to)
{
   auto issuer   = getSender();
   auto nftTable = tables().open<NftTable>();
   auto record   = nftTable.get(std::tuple{issuer, nftId});

   check(record.has_value(), nftDNE);
   check(record->owner == from, notNftOwner);
   check(to != from, creditorIsDebitor);
   checkAccountValid(to);

   record->owner = to;
   nftTable.put(*record);

   emit().history("transferred", {{"issuer", issuer.str()},
                                  {"nftId", std::to_string(nftId)},
                                  {"creditor", from.str()},
                                  {"debitor", to.str()}});
}

optional<AccountNumber> Nft::ownerOf(NID nftId)
{
   auto record = getNft(getSender(), nftId);
   if (!record)
      return nullopt;
   return record->owner;
}

optional<NftRecord> Nft::getNft(AccountNumber issuer, NID nftId)
{
   return tables().open<NftTable>().get(std::tuple{issuer, nftId});
}

bool Nft::exists(AccountNumber issuer, NID nftId)
{
   return getNft(issuer, nftId).has_value();
}

void Nft::checkAccountValid(AccountNumber account)
{
   check(account != Accounts::nullAccount, invalidAccount);
   check(to<Accounts>()->exists(account), invalidAccount);
}
