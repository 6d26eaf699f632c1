#pragma once

#include <string>
#include <vector>

#include "internal/skeleton/task_skeleton.hpp"

namespace tasktree::skeleton {

/*
  Delegation fragments a parent declares in its own outline, in outline
  order. Sources:
    - <new_task> ... </new_task> blocks in assistant text or tool calls
      (the inner <message>, when present, is the directive)
    - tool calls named "new_task" without markup (the whole text)

  Fragments are returned decoded and whitespace-collapsed but not
  truncated; the prefix index canonicalizes the full fragment.
*/
std::vector<std::string> ExtractDelegationFragments(const TaskSkeleton& skeleton);

} // namespace tasktree::skeleton
