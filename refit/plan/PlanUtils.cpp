/*
 * Copyright (c) Meta Platforms, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "refit/plan/PlanUtils.h"
#include "refit/plan/TransformHints.h"
#include "velox/common/base/Exceptions.h"

namespace facebook::refit::plan {

PlanNodePtr transformUp(const PlanNodePtr& plan, const NodeRewrite& rewrite) {
  VELOX_CHECK_NOT_NULL(plan);

  const auto& sources = plan->sources();

  std::vector<PlanNodePtr> newSources;
  newSources.reserve(sources.size());
  bool changed = false;
  for (const auto& source : sources) {
    newSources.push_back(transformUp(source, rewrite));
    changed |= newSources.back() != source;
  }

  PlanNodePtr node = plan;
  if (changed) {
    node = plan->withSources(std::move(newSources));
    hints::copyTags(*plan, *node);
  }

  if (auto rewritten = rewrite(node, plan)) {
    return rewritten;
  }
  return node;
}

void forEachNode(
    const PlanNodePtr& plan,
    const std::function<void(const PlanNode&)>& visitor) {
  visitor(*plan);
  for (const auto& source : plan->sources()) {
    forEachNode(source, visitor);
  }
}

} // namespace facebook::refit::plan
