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

#include "refit/optimizer/PullOutPostProject.h"
#include <fmt/format.h>
#include <glog/logging.h>
#include <vector>
#include "refit/plan/PlanUtils.h"
#include "refit/plan/TransformHints.h"
#include "velox/common/base/Exceptions.h"

namespace facebook::refit::optimizer {

PullOutPostProject::PullOutPostProject(
    std::shared_ptr<const NativeOutputResolver> resolver,
    RewriteOptions options)
    : resolver_{std::move(resolver)}, options_{options} {
  VELOX_CHECK_NOT_NULL(resolver_);
}

plan::PlanNodePtr PullOutPostProject::apply(
    const plan::PlanNodePtr& plan) const {
  if (!options_.enablePullOutPostProject) {
    return plan;
  }

  // Aggregations replaced by a post-projection. Their tags are cleared only
  // once the whole plan has been rewritten, so a failure leaves 'plan' as is.
  std::vector<plan::PlanNodePtr> replaced;

  auto newPlan = plan::transformUp(
      plan,
      [&](const plan::PlanNodePtr& node,
          const plan::PlanNodePtr& original) -> plan::PlanNodePtr {
        auto adaptation = applyLocally(node);
        if (!adaptation.has_value()) {
          return nullptr;
        }

        replaced.push_back(original);
        if (node != original) {
          replaced.push_back(node);
        }

        if (options_.traceEnabled(RewriteOptions::kTraceRewrites)) {
          LOG(INFO) << "Pulled out post-project for aggregate " << node->id()
                    << ":\n"
                    << adaptation->postProject->toString(true, true);
        }
        return adaptation->postProject;
      });

  for (const auto& node : replaced) {
    plan::hints::untag(*node);
  }
  return newPlan;
}

plan::PlanNodePtr PullOutPostProject::applyForValidation(
    const plan::PlanNodePtr& node) const {
  auto adaptation = applyLocally(node);
  if (!adaptation.has_value()) {
    return node;
  }

  if (options_.traceEnabled(RewriteOptions::kTraceValidation)) {
    LOG(INFO) << "Validating aggregate " << node->id()
              << " with native output: "
              << adaptation->aggregate->toString(true, false);
  }
  return adaptation->aggregate;
}

bool PullOutPostProject::needsPostProjection(
    const plan::AggregateNode& aggregate) const {
  if (plan::hints::isTaggedAsNotTransformable(aggregate)) {
    return false;
  }
  return needsPostProjection(
      aggregate.resultExpressions(), resolver_->resolve(aggregate));
}

// static
bool PullOutPostProject::needsPostProjection(
    const plan::NamedExprVector& resultExpressions,
    const plan::AttributeVector& nativeOutput) {
  if (resultExpressions.size() != nativeOutput.size()) {
    return true;
  }

  for (auto i = 0; i < resultExpressions.size(); ++i) {
    // The native engine only emits columns. Anything else must be computed by
    // a projection.
    auto column =
        plan::asAttributeReference(plan::stripRenaming(resultExpressions[i]));
    if (!column.has_value() || !column->compatibleWith(nativeOutput[i])) {
      return true;
    }
  }
  return false;
}

std::optional<PullOutPostProject::Adaptation> PullOutPostProject::applyLocally(
    const plan::PlanNodePtr& node) const {
  if (!options_.enablePullOutPostProject) {
    return std::nullopt;
  }

  switch (node->kind()) {
    case plan::PlanNodeKind::kAggregate:
      break;
    case plan::PlanNodeKind::kTableScan:
    case plan::PlanNodeKind::kFilter:
    case plan::PlanNodeKind::kProject:
      return std::nullopt;
  }

  const auto& aggregate = static_cast<const plan::AggregateNode&>(*node);
  if (plan::hints::isTaggedAsNotTransformable(aggregate)) {
    VLOG(1) << "Skipping aggregate " << aggregate.id()
            << " tagged as not transformable: "
            << plan::hints::notTransformableReason(aggregate);
    return std::nullopt;
  }

  // Resolved once and used both to detect the mismatch and to build the new
  // aggregation.
  const auto nativeOutput = resolver_->resolve(aggregate);
  if (!needsPostProjection(aggregate.resultExpressions(), nativeOutput)) {
    return std::nullopt;
  }

  return pullOutPostProject(aggregate, nativeOutput);
}

PullOutPostProject::Adaptation PullOutPostProject::pullOutPostProject(
    const plan::AggregateNode& aggregate,
    const plan::AttributeVector& nativeOutput) const {
  auto newAggregate =
      aggregate.withResultExpressions(plan::toNamedExprs(nativeOutput));
  VELOX_CHECK(
      newAggregate->output() == nativeOutput,
      "Aggregate {} declares {} instead of its native output {}",
      aggregate.id(),
      plan::toString(newAggregate->output()),
      plan::toString(nativeOutput));

  plan::hints::copyTags(aggregate, *newAggregate);

  auto postProject = std::make_shared<plan::ProjectNode>(
      fmt::format("{}.postProject", aggregate.id()),
      aggregate.resultExpressions(),
      newAggregate);
  VELOX_CHECK(
      postProject->output() == aggregate.output(),
      "Post-project of aggregate {} produces {} instead of {}",
      aggregate.id(),
      plan::toString(postProject->output()),
      plan::toString(aggregate.output()));

  return {std::move(postProject), std::move(newAggregate)};
}

} // namespace facebook::refit::optimizer
