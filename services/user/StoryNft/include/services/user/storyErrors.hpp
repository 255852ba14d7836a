#pragma once

#include <storybase/check.hpp>

namespace UserService
{
   namespace Errors
   {
      // These are reported to clients by number
      constexpr storybase::ErrorCode invalidStory{400, "InvalidStory"};
      constexpr storybase::ErrorCode insufficientFunds{402, "InsufficientFunds"};
      constexpr storybase::ErrorCode unauthorized{403, "Unauthorized"};
      constexpr storybase::ErrorCode storyNotFound{404, "StoryNotFound"};
   }  // namespace Errors
}  // namespace UserService
