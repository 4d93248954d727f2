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

#include "refit/optimizer/NativeOutputResolver.h"
#include "velox/common/base/Exceptions.h"
#include "velox/exec/Aggregate.h"
#include "velox/exec/AggregateFunctionRegistry.h"

namespace facebook::refit::optimizer {

namespace {

std::vector<velox::TypePtr> rawInputTypes(
    const plan::AggregateCall& aggregate) {
  if (!aggregate.rawInputTypes.empty()) {
    return aggregate.rawInputTypes;
  }

  std::vector<velox::TypePtr> types;
  types.reserve(aggregate.call->inputs().size());
  for (const auto& input : aggregate.call->inputs()) {
    types.push_back(input->type());
  }
  return types;
}

} // namespace

plan::AttributeVector VeloxNativeOutputResolver::resolve(
    const plan::NamedExprVector& groupingKeys,
    const plan::AggregateCallVector& aggregates,
    const plan::AttributeVector& aggregateResults,
    plan::AggregationStep step) const {
  VELOX_CHECK_EQ(aggregates.size(), aggregateResults.size());

  plan::AttributeVector attributes;
  attributes.reserve(groupingKeys.size() + aggregates.size());

  for (const auto& key : groupingKeys) {
    attributes.push_back(key.toAttribute());
  }

  for (auto i = 0; i < aggregates.size(); ++i) {
    const auto& name = aggregates[i].call->name();
    VELOX_USER_CHECK(
        velox::exec::getAggregateFunctionSignatures(name).has_value(),
        "Cannot resolve native output of aggregate function: {}",
        name);

    if (!plan::isPartialOutput(step)) {
      attributes.push_back(aggregateResults[i]);
      continue;
    }

    // The inputs of an intermediate aggregation are accumulators, not raw
    // input.
    VELOX_USER_CHECK(
        step == plan::AggregationStep::kPartial ||
            !aggregates[i].rawInputTypes.empty(),
        "Cannot resolve native output of aggregate function: {}. Raw input types are required for step {}",
        name,
        plan::toString(step));

    attributes.push_back(
        {aggregateResults[i].name,
         velox::exec::resolveIntermediateType(
             name, rawInputTypes(aggregates[i]))});
  }

  return attributes;
}

} // namespace facebook::refit::optimizer
