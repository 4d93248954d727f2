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
#include <sstream>
#include <string>
#include <vector>
#include "refit/plan/Attribute.h"
#include "refit/plan/NodeTags.h"

namespace facebook::refit::plan {

enum class PlanNodeKind {
  kTableScan,
  kFilter,
  kProject,
  kAggregate,
};

std::string_view toString(PlanNodeKind kind);

using PlanNodeId = std::string;

class PlanNode;
using PlanNodePtr = std::shared_ptr<const PlanNode>;

/// A node in a physical plan tree. Nodes are immutable once built and are
/// shared between trees. The only mutable state is the out-of-band tags().
class PlanNode {
 public:
  PlanNode(PlanNodeKind kind, PlanNodeId id)
      : kind_{kind}, id_{std::move(id)} {}

  virtual ~PlanNode() = default;

  PlanNodeKind kind() const {
    return kind_;
  }

  const PlanNodeId& id() const {
    return id_;
  }

  virtual const velox::RowTypePtr& outputType() const = 0;

  virtual const std::vector<PlanNodePtr>& sources() const = 0;

  AttributeVector output() const {
    return toAttributes(*outputType());
  }

  /// Returns a copy of this node with the same id and parameters but with
  /// 'sources' as inputs. Tags are not copied.
  virtual PlanNodePtr withSources(std::vector<PlanNodePtr> sources) const = 0;

  NodeTags& tags() const {
    return tags_;
  }

  template <typename T>
  bool is() const {
    return dynamic_cast<const T*>(this) != nullptr;
  }

  template <typename T>
  const T* as() const {
    return dynamic_cast<const T*>(this);
  }

  /// @param detailed Include node parameters, e.g. projections and grouping
  /// keys.
  /// @param recursive Include all sources, indented by depth.
  std::string toString(bool detailed = false, bool recursive = false) const;

 protected:
  virtual std::string_view name() const = 0;

  virtual void addDetails(std::stringstream& stream) const = 0;

 private:
  void toString(
      std::stringstream& stream,
      bool detailed,
      bool recursive,
      size_t indentation) const;

  const PlanNodeKind kind_;
  const PlanNodeId id_;
  mutable NodeTags tags_;
};

class TableScanNode : public PlanNode {
 public:
  TableScanNode(
      PlanNodeId id,
      std::string tableName,
      velox::RowTypePtr outputType);

  const velox::RowTypePtr& outputType() const override {
    return outputType_;
  }

  const std::vector<PlanNodePtr>& sources() const override;

  PlanNodePtr withSources(std::vector<PlanNodePtr> sources) const override;

  const std::string& tableName() const {
    return tableName_;
  }

 protected:
  std::string_view name() const override {
    return "TableScan";
  }

  void addDetails(std::stringstream& stream) const override;

 private:
  const std::string tableName_;
  const velox::RowTypePtr outputType_;
};

class FilterNode : public PlanNode {
 public:
  FilterNode(
      PlanNodeId id,
      velox::core::TypedExprPtr filter,
      PlanNodePtr source);

  const velox::RowTypePtr& outputType() const override {
    return sources_[0]->outputType();
  }

  const std::vector<PlanNodePtr>& sources() const override {
    return sources_;
  }

  PlanNodePtr withSources(std::vector<PlanNodePtr> sources) const override;

  const velox::core::TypedExprPtr& filter() const {
    return filter_;
  }

 protected:
  std::string_view name() const override {
    return "Filter";
  }

  void addDetails(std::stringstream& stream) const override;

 private:
  const std::vector<PlanNodePtr> sources_;
  const velox::core::TypedExprPtr filter_;
};

/// Evaluates 'projections' against the output of its only source. Every input
/// column a projection refers to must be produced by the source with the same
/// type.
class ProjectNode : public PlanNode {
 public:
  ProjectNode(PlanNodeId id, NamedExprVector projections, PlanNodePtr source);

  const velox::RowTypePtr& outputType() const override {
    return outputType_;
  }

  const std::vector<PlanNodePtr>& sources() const override {
    return sources_;
  }

  PlanNodePtr withSources(std::vector<PlanNodePtr> sources) const override;

  const NamedExprVector& projections() const {
    return projections_;
  }

 protected:
  std::string_view name() const override {
    return "Project";
  }

  void addDetails(std::stringstream& stream) const override;

 private:
  const std::vector<PlanNodePtr> sources_;
  const NamedExprVector projections_;
  const velox::RowTypePtr outputType_;
};

/// Physical form of an aggregation.
enum class AggregationStrategy {
  kHash,
  kSort,
  kObjectHash,
};

std::string_view toString(AggregationStrategy strategy);

enum class AggregationStep {
  /// Raw input in, intermediate results out.
  kPartial,
  /// Intermediate results in, intermediate results out.
  kIntermediate,
  /// Intermediate results in, final results out.
  kFinal,
  /// Raw input in, final results out.
  kSingle,
};

std::string_view toString(AggregationStep step);

/// Returns true if an aggregation in 'step' produces intermediate results.
bool isPartialOutput(AggregationStep step);

struct AggregateCall {
  velox::core::CallTypedExprPtr call;

  /// Types of the raw input columns. Required to resolve intermediate types
  /// when 'call' consumes intermediate results. Defaults to the input types
  /// of 'call' otherwise.
  std::vector<velox::TypePtr> rawInputTypes;

  std::string toString() const;
};

using AggregateCallVector = std::vector<AggregateCall>;

/// Computes 'aggregates' grouped by 'groupingKeys'. 'aggregateResults'[i] is
/// the placeholder attribute bound to the output of 'aggregates'[i]. The
/// declared output of the node is 'resultExpressions', which are built from
/// grouping key outputs and aggregate result attributes.
class AggregateNode : public PlanNode {
 public:
  AggregateNode(
      PlanNodeId id,
      AggregationStrategy strategy,
      AggregationStep step,
      NamedExprVector groupingKeys,
      AggregateCallVector aggregates,
      AttributeVector aggregateResults,
      NamedExprVector resultExpressions,
      PlanNodePtr source);

  const velox::RowTypePtr& outputType() const override {
    return outputType_;
  }

  const std::vector<PlanNodePtr>& sources() const override {
    return sources_;
  }

  PlanNodePtr withSources(std::vector<PlanNodePtr> sources) const override;

  /// Returns a copy of this node, id included, that declares
  /// 'resultExpressions' as its output. Tags are not copied.
  std::shared_ptr<const AggregateNode> withResultExpressions(
      NamedExprVector resultExpressions) const;

  AggregationStrategy strategy() const {
    return strategy_;
  }

  AggregationStep step() const {
    return step_;
  }

  const NamedExprVector& groupingKeys() const {
    return groupingKeys_;
  }

  const AggregateCallVector& aggregates() const {
    return aggregates_;
  }

  const AttributeVector& aggregateResults() const {
    return aggregateResults_;
  }

  const NamedExprVector& resultExpressions() const {
    return resultExpressions_;
  }

 protected:
  std::string_view name() const override {
    return "Aggregate";
  }

  void addDetails(std::stringstream& stream) const override;

 private:
  const AggregationStrategy strategy_;
  const AggregationStep step_;
  const NamedExprVector groupingKeys_;
  const AggregateCallVector aggregates_;
  const AttributeVector aggregateResults_;
  const NamedExprVector resultExpressions_;
  const std::vector<PlanNodePtr> sources_;
  const velox::RowTypePtr outputType_;
};

using AggregateNodePtr = std::shared_ptr<const AggregateNode>;
using ProjectNodePtr = std::shared_ptr<const ProjectNode>;

} // namespace facebook::refit::plan
