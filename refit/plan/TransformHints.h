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

#include "refit/plan/PlanNode.h"

/// Offload eligibility of plan nodes. Tags are written by the planning stage
/// that decides what can run natively and are read by later rewrites.
namespace facebook::refit::plan::hints {

void tagTransformable(const PlanNode& node);

void tagNotTransformable(const PlanNode& node, std::string reason);

bool isTaggedAsTransformable(const PlanNode& node);

/// True if 'node' has been excluded from offload.
bool isTaggedAsNotTransformable(const PlanNode& node);

/// Returns the reason 'node' was excluded from offload, or an empty string.
std::string notTransformableReason(const PlanNode& node);

/// Replaces all tags of 'to' with those of 'from'.
void copyTags(const PlanNode& from, const PlanNode& to);

/// Removes the offload tag from 'node'.
void untag(const PlanNode& node);

} // namespace facebook::refit::plan::hints
