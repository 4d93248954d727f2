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

#include <memory>
#include <optional>
#include "refit/optimizer/NativeOutputResolver.h"
#include "refit/optimizer/RewriteOptions.h"
#include "refit/optimizer/Rule.h"

namespace facebook::refit::optimizer {

/// The native engine does not always produce the columns an aggregation
/// declares: result expressions may rename, compute or drop columns, and the
/// native layout of grouping keys and aggregates may differ in number, name or
/// type. When that happens this rule makes the aggregation declare its native
/// output and adds a projection on top of it that evaluates the original
/// result expressions. Plan nodes above the aggregation then see the same
/// columns whether the aggregation runs natively or falls back.
///
/// Aggregations tagged as not transformable are left alone.
class PullOutPostProject : public ValidationApplyRule {
 public:
  explicit PullOutPostProject(
      std::shared_ptr<const NativeOutputResolver> resolver,
      RewriteOptions options = {});

  std::string_view name() const override {
    return "PullOutPostProject";
  }

  /// Adds a post-projection above every transformable aggregation whose
  /// native output differs from its result expressions. The replaced
  /// aggregation loses its offload tag; the new one inherits it. If the
  /// rewrite throws, no tag in 'plan' is changed.
  plan::PlanNodePtr apply(const plan::PlanNodePtr& plan) const override;

  /// Returns the aggregation as it would look after apply(), without the
  /// post-projection. 'node' and its tags are left as is.
  plan::PlanNodePtr applyForValidation(
      const plan::PlanNodePtr& node) const override;

  /// Returns true if 'aggregate' is transformable and its result expressions
  /// differ from the native output: different number of columns, a result
  /// that is not a plain column reference once renaming is stripped, or a
  /// column whose name or type differs from the native one.
  bool needsPostProjection(const plan::AggregateNode& aggregate) const;

 private:
  struct Adaptation {
    // Evaluates the original result expressions over 'aggregate'.
    plan::ProjectNodePtr postProject;

    // Copy of the original aggregation that declares its native output.
    plan::AggregateNodePtr aggregate;
  };

  static bool needsPostProjection(
      const plan::NamedExprVector& resultExpressions,
      const plan::AttributeVector& nativeOutput);

  // Shared by apply() and applyForValidation(). Returns std::nullopt if 'node'
  // stays as is. Tags are copied to the new aggregation but are not removed
  // from 'node'.
  std::optional<Adaptation> applyLocally(const plan::PlanNodePtr& node) const;

  Adaptation pullOutPostProject(
      const plan::AggregateNode& aggregate,
      const plan::AttributeVector& nativeOutput) const;

  const std::shared_ptr<const NativeOutputResolver> resolver_;
  const RewriteOptions options_;
};

} // namespace facebook::refit::optimizer
