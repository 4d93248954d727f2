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

#include "refit/plan/PlanNode.h"
#include <folly/container/F14Set.h>
#include "velox/common/base/Exceptions.h"

namespace facebook::refit::plan {

std::string_view toString(PlanNodeKind kind) {
  switch (kind) {
    case PlanNodeKind::kTableScan:
      return "TABLE_SCAN";
    case PlanNodeKind::kFilter:
      return "FILTER";
    case PlanNodeKind::kProject:
      return "PROJECT";
    case PlanNodeKind::kAggregate:
      return "AGGREGATE";
  }
  VELOX_UNREACHABLE();
}

std::string_view toString(AggregationStrategy strategy) {
  switch (strategy) {
    case AggregationStrategy::kHash:
      return "HASH";
    case AggregationStrategy::kSort:
      return "SORT";
    case AggregationStrategy::kObjectHash:
      return "OBJECT_HASH";
  }
  VELOX_UNREACHABLE();
}

std::string_view toString(AggregationStep step) {
  switch (step) {
    case AggregationStep::kPartial:
      return "PARTIAL";
    case AggregationStep::kIntermediate:
      return "INTERMEDIATE";
    case AggregationStep::kFinal:
      return "FINAL";
    case AggregationStep::kSingle:
      return "SINGLE";
  }
  VELOX_UNREACHABLE();
}

bool isPartialOutput(AggregationStep step) {
  return step == AggregationStep::kPartial ||
      step == AggregationStep::kIntermediate;
}

namespace {

// Verifies that every input column referenced by 'exprs' is produced by
// 'inputType' with the same type.
template <typename Exprs, typename GetExpr>
void checkInputColumns(
    std::string_view nodeName,
    const Exprs& exprs,
    GetExpr getExpr,
    const velox::RowType& inputType) {
  AttributeVector columns;
  for (const auto& expr : exprs) {
    collectInputColumns(getExpr(expr), columns);
  }

  for (const auto& column : columns) {
    auto index = inputType.getChildIdxIfExists(column.name);
    VELOX_USER_CHECK(
        index.has_value(),
        "{} refers to a column its input does not produce: {}. Input: {}",
        nodeName,
        column.name,
        inputType.toString());

    const auto& inputColumnType = inputType.childAt(index.value());
    VELOX_USER_CHECK(
        *inputColumnType == *column.type,
        "{} refers to column {} as {}, but its input produces {}",
        nodeName,
        column.name,
        column.type->toString(),
        inputColumnType->toString());
  }
}

void appendNamedExprs(std::stringstream& stream, const NamedExprVector& exprs) {
  for (auto i = 0; i < exprs.size(); ++i) {
    if (i > 0) {
      stream << ", ";
    }
    stream << exprs[i].toString();
  }
}

velox::RowTypePtr makeOutputType(const NamedExprVector& exprs) {
  AttributeVector attributes;
  attributes.reserve(exprs.size());
  for (const auto& expr : exprs) {
    VELOX_USER_CHECK_NOT_NULL(
        expr.expr, "Missing expression for {}", expr.name);
    attributes.push_back(expr.toAttribute());
  }
  return toRowType(attributes);
}

const PlanNodePtr& onlySource(
    std::string_view nodeName,
    const std::vector<PlanNodePtr>& sources) {
  VELOX_USER_CHECK_EQ(
      sources.size(), 1, "{} node must have exactly one source", nodeName);
  return sources[0];
}

} // namespace

std::string PlanNode::toString(bool detailed, bool recursive) const {
  std::stringstream stream;
  toString(stream, detailed, recursive, 0);
  return stream.str();
}

void PlanNode::toString(
    std::stringstream& stream,
    bool detailed,
    bool recursive,
    size_t indentation) const {
  stream << std::string(indentation * 2, ' ') << "-- " << name() << "[" << id_
         << "]";
  if (detailed) {
    stream << "[";
    addDetails(stream);
    stream << "]";
  }

  const auto& type = outputType();
  stream << " -> ";
  for (auto i = 0; i < type->size(); ++i) {
    if (i > 0) {
      stream << ", ";
    }
    stream << type->nameOf(i) << ":" << type->childAt(i)->toString();
  }
  stream << std::endl;

  if (recursive) {
    for (const auto& source : sources()) {
      source->toString(stream, detailed, true, indentation + 1);
    }
  }
}

TableScanNode::TableScanNode(
    PlanNodeId id,
    std::string tableName,
    velox::RowTypePtr outputType)
    : PlanNode(PlanNodeKind::kTableScan, std::move(id)),
      tableName_{std::move(tableName)},
      outputType_{std::move(outputType)} {
  VELOX_USER_CHECK_NOT_NULL(outputType_);
}

const std::vector<PlanNodePtr>& TableScanNode::sources() const {
  static const std::vector<PlanNodePtr> kEmptySources;
  return kEmptySources;
}

PlanNodePtr TableScanNode::withSources(std::vector<PlanNodePtr> sources) const {
  VELOX_USER_CHECK(sources.empty(), "TableScan node cannot have sources");
  return std::make_shared<TableScanNode>(id(), tableName_, outputType_);
}

void TableScanNode::addDetails(std::stringstream& stream) const {
  stream << "table: " << tableName_;
}

FilterNode::FilterNode(
    PlanNodeId id,
    velox::core::TypedExprPtr filter,
    PlanNodePtr source)
    : PlanNode(PlanNodeKind::kFilter, std::move(id)),
      sources_{std::move(source)},
      filter_{std::move(filter)} {
  VELOX_USER_CHECK_NOT_NULL(sources_[0]);
  VELOX_USER_CHECK_NOT_NULL(filter_);
  VELOX_USER_CHECK(
      filter_->type()->kind() == velox::TypeKind::BOOLEAN,
      "Filter expression must be of type BOOLEAN: {}",
      filter_->toString());
  checkInputColumns(
      name(),
      std::vector<velox::core::TypedExprPtr>{filter_},
      [](const auto& expr) -> const auto& { return expr; },
      *sources_[0]->outputType());
}

PlanNodePtr FilterNode::withSources(std::vector<PlanNodePtr> sources) const {
  return std::make_shared<FilterNode>(
      id(), filter_, onlySource(name(), sources));
}

void FilterNode::addDetails(std::stringstream& stream) const {
  stream << "expression: " << filter_->toString();
}

ProjectNode::ProjectNode(
    PlanNodeId id,
    NamedExprVector projections,
    PlanNodePtr source)
    : PlanNode(PlanNodeKind::kProject, std::move(id)),
      sources_{std::move(source)},
      projections_{std::move(projections)},
      outputType_{makeOutputType(projections_)} {
  VELOX_USER_CHECK_NOT_NULL(sources_[0]);
  checkInputColumns(
      name(),
      projections_,
      [](const NamedExpr& expr) -> const auto& { return expr.expr; },
      *sources_[0]->outputType());
}

PlanNodePtr ProjectNode::withSources(std::vector<PlanNodePtr> sources) const {
  return std::make_shared<ProjectNode>(
      id(), projections_, onlySource(name(), sources));
}

void ProjectNode::addDetails(std::stringstream& stream) const {
  appendNamedExprs(stream, projections_);
}

std::string AggregateCall::toString() const {
  return call->toString();
}

AggregateNode::AggregateNode(
    PlanNodeId id,
    AggregationStrategy strategy,
    AggregationStep step,
    NamedExprVector groupingKeys,
    AggregateCallVector aggregates,
    AttributeVector aggregateResults,
    NamedExprVector resultExpressions,
    PlanNodePtr source)
    : PlanNode(PlanNodeKind::kAggregate, std::move(id)),
      strategy_{strategy},
      step_{step},
      groupingKeys_{std::move(groupingKeys)},
      aggregates_{std::move(aggregates)},
      aggregateResults_{std::move(aggregateResults)},
      resultExpressions_{std::move(resultExpressions)},
      sources_{std::move(source)},
      outputType_{makeOutputType(resultExpressions_)} {
  VELOX_USER_CHECK_NOT_NULL(sources_[0]);
  VELOX_USER_CHECK_EQ(
      aggregates_.size(),
      aggregateResults_.size(),
      "Each aggregate must have exactly one result attribute");

  const auto& inputType = *sources_[0]->outputType();
  checkInputColumns(
      name(),
      groupingKeys_,
      [](const NamedExpr& key) -> const auto& { return key.expr; },
      inputType);

  for (const auto& aggregate : aggregates_) {
    VELOX_USER_CHECK_NOT_NULL(aggregate.call);
  }
  checkInputColumns(
      name(),
      aggregates_,
      [](const AggregateCall& aggregate) -> velox::core::TypedExprPtr {
        return aggregate.call;
      },
      inputType);

  // Result expressions are evaluated over grouping key outputs and aggregate
  // results. Their types depend on the step, so only names are checked here.
  folly::F14FastSet<std::string_view> available;
  for (const auto& key : groupingKeys_) {
    available.insert(key.name);
  }
  for (const auto& result : aggregateResults_) {
    available.insert(result.name);
  }

  AttributeVector columns;
  for (const auto& expr : resultExpressions_) {
    collectInputColumns(expr.expr, columns);
  }
  for (const auto& column : columns) {
    VELOX_USER_CHECK(
        available.contains(column.name),
        "Aggregate result expression refers to {}, which is neither a grouping key nor an aggregate result",
        column.name);
  }
}

PlanNodePtr AggregateNode::withSources(std::vector<PlanNodePtr> sources) const {
  return std::make_shared<AggregateNode>(
      id(),
      strategy_,
      step_,
      groupingKeys_,
      aggregates_,
      aggregateResults_,
      resultExpressions_,
      onlySource(name(), sources));
}

std::shared_ptr<const AggregateNode> AggregateNode::withResultExpressions(
    NamedExprVector resultExpressions) const {
  return std::make_shared<AggregateNode>(
      id(),
      strategy_,
      step_,
      groupingKeys_,
      aggregates_,
      aggregateResults_,
      std::move(resultExpressions),
      sources_[0]);
}

void AggregateNode::addDetails(std::stringstream& stream) const {
  stream << plan::toString(strategy_) << " " << plan::toString(step_) << " [";
  appendNamedExprs(stream, groupingKeys_);
  stream << "] ";
  for (auto i = 0; i < aggregates_.size(); ++i) {
    if (i > 0) {
      stream << ", ";
    }
    stream << aggregateResults_[i].name << " := "
           << aggregates_[i].toString();
  }
  stream << " => ";
  appendNamedExprs(stream, resultExpressions_);
}

} // namespace facebook::refit::plan
