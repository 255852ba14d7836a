#pragma once
#include <storybase/Table.hpp>

namespace UserService
{
   struct InitializedRecord
   {
   };
   using InitTable = storybase::Table<InitializedRecord, storybase::SingletonKey{}>;

}  // namespace UserService
