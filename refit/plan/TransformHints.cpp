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

#include "refit/plan/TransformHints.h"

namespace facebook::refit::plan::hints {

namespace {
bool hasHint(const PlanNode& node, TransformHint::Kind kind) {
  const auto& hint = node.tags().transformHint();
  return hint.has_value() && hint->kind == kind;
}
} // namespace

void tagTransformable(const PlanNode& node) {
  node.tags().setTransformHint({TransformHint::Kind::kTransformable, ""});
}

void tagNotTransformable(const PlanNode& node, std::string reason) {
  node.tags().setTransformHint(
      {TransformHint::Kind::kNotTransformable, std::move(reason)});
}

bool isTaggedAsTransformable(const PlanNode& node) {
  return hasHint(node, TransformHint::Kind::kTransformable);
}

bool isTaggedAsNotTransformable(const PlanNode& node) {
  return hasHint(node, TransformHint::Kind::kNotTransformable);
}

std::string notTransformableReason(const PlanNode& node) {
  if (!isTaggedAsNotTransformable(node)) {
    return "";
  }
  return node.tags().transformHint()->reason;
}

void copyTags(const PlanNode& from, const PlanNode& to) {
  to.tags().copyFrom(from.tags());
}

void untag(const PlanNode& node) {
  node.tags().unsetTransformHint();
}

} // namespace facebook::refit::plan::hints
