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

#include <string_view>
#include "refit/plan/PlanNode.h"

namespace facebook::refit::optimizer {

/// A rewrite of a physical plan. Rules of one plan run one after another on a
/// single thread.
class Rule {
 public:
  virtual ~Rule() = default;

  virtual std::string_view name() const = 0;

  /// Rewrites the whole tree rooted at 'plan' and returns the new root.
  virtual plan::PlanNodePtr apply(const plan::PlanNodePtr& plan) const = 0;
};

/// A rule that offload validation also runs on individual nodes before the
/// plan is committed.
class ValidationApplyRule : public Rule {
 public:
  /// Applies the rule to 'node' only, without visiting its sources. Must not
  /// modify 'node' and must return equal results when called repeatedly. If
  /// the rule adds nodes on top of 'node' only to restore its output, they are
  /// dropped and the node underneath is returned. Returns 'node' if the rule
  /// does not apply.
  virtual plan::PlanNodePtr applyForValidation(
      const plan::PlanNodePtr& node) const = 0;
};

} // namespace facebook::refit::optimizer
