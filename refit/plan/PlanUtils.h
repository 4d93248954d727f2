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

#pragma once

#include <functional>
#include "refit/plan/PlanNode.h"

namespace facebook::refit::plan {

/// Returns the replacement for 'node', or nullptr to keep it. 'original' is
/// the node of the input plan that 'node' stands for. The two differ when the
/// sources of 'original' were transformed and 'node' is its rebuilt copy.
using NodeRewrite = std::function<
    PlanNodePtr(const PlanNodePtr& node, const PlanNodePtr& original)>;

/// Rewrites 'plan' bottom-up. Sources are transformed first. A node whose
/// sources did not change is passed to 'rewrite' as is; otherwise it is
/// rebuilt on top of the new sources and keeps its tags. 'rewrite' is applied
/// once per node and never to the nodes it returns. Subtrees that 'rewrite'
/// leaves alone are returned unchanged, pointers included.
PlanNodePtr transformUp(const PlanNodePtr& plan, const NodeRewrite& rewrite);

/// Calls 'visitor' on every node of 'plan', parents before sources.
void forEachNode(
    const PlanNodePtr& plan,
    const std::function<void(const PlanNode&)>& visitor);

} // namespace facebook::refit::plan
