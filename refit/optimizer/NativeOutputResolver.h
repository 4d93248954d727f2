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

namespace facebook::refit::optimizer {

/// Computes the columns a native engine emits for an aggregation. The result
/// must be a pure function of the arguments: the same inputs always produce
/// the same attributes.
class NativeOutputResolver {
 public:
  virtual ~NativeOutputResolver() = default;

  /// Returns the attributes the native aggregation produces, in order.
  /// Throws a user error if the native engine cannot compute one of
  /// 'aggregates'.
  virtual plan::AttributeVector resolve(
      const plan::NamedExprVector& groupingKeys,
      const plan::AggregateCallVector& aggregates,
      const plan::AttributeVector& aggregateResults,
      plan::AggregationStep step) const = 0;

  plan::AttributeVector resolve(const plan::AggregateNode& aggregate) const {
    return resolve(
        aggregate.groupingKeys(),
        aggregate.aggregates(),
        aggregate.aggregateResults(),
        aggregate.step());
  }
};

/// Output layout of Velox hash aggregation: grouping keys followed by one
/// column per aggregate. Steps that produce final results emit the declared
/// result attributes. Steps that produce intermediate results emit a single
/// column per aggregate, typed with the function's intermediate type, e.g.
/// ROW(DOUBLE, BIGINT) for avg(DOUBLE).
///
/// Functions are looked up in the Velox aggregate function registry.
class VeloxNativeOutputResolver : public NativeOutputResolver {
 public:
  using NativeOutputResolver::resolve;

  plan::AttributeVector resolve(
      const plan::NamedExprVector& groupingKeys,
      const plan::AggregateCallVector& aggregates,
      const plan::AttributeVector& aggregateResults,
      plan::AggregationStep step) const override;
};

} // namespace facebook::refit::optimizer
