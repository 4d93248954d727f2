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

#include "refit/optimizer/tests/PlanMatcher.h"
#include <folly/Demangle.h>
#include <gtest/gtest.h>
#include <algorithm>
#include "velox/common/base/Exceptions.h"

namespace facebook::refit::optimizer::test {
namespace {

#define REFIT_TEST_RETURN_IF_FAILURE           \
  if (::testing::Test::HasNonfatalFailure()) { \
    return false;                              \
  }

#define REFIT_TEST_RETURN                        \
  return !::testing::Test::HasNonfatalFailure();

template <typename T>
class PlanMatcherImpl : public PlanMatcher {
 public:
  PlanMatcherImpl() = default;

  explicit PlanMatcherImpl(const std::shared_ptr<PlanMatcher>& sourceMatcher)
      : sourceMatchers_{{sourceMatcher}} {}

  bool match(const plan::PlanNodePtr& plan) const override {
    const auto* specificNode = dynamic_cast<const T*>(plan.get());
    EXPECT_TRUE(specificNode != nullptr)
        << "Expected " << folly::demangle(typeid(T).name()) << ", but got "
        << plan->toString(false, false);
    REFIT_TEST_RETURN_IF_FAILURE

    EXPECT_EQ(plan->sources().size(), sourceMatchers_.size());
    REFIT_TEST_RETURN_IF_FAILURE

    for (auto i = 0; i < sourceMatchers_.size(); ++i) {
      if (!sourceMatchers_[i]->match(plan->sources()[i])) {
        return false;
      }
    }

    return matchDetails(*specificNode);
  }

 protected:
  virtual bool matchDetails(const T& /*plan*/) const {
    return true;
  }

  const std::vector<std::shared_ptr<PlanMatcher>> sourceMatchers_;
};

void expectOutputNames(
    const plan::PlanNode& plan,
    const std::vector<std::string>& outputNames) {
  const auto& outputType = plan.outputType();
  EXPECT_EQ(outputType->size(), outputNames.size());
  for (auto i = 0; i < std::min<size_t>(outputType->size(), outputNames.size());
       ++i) {
    EXPECT_EQ(outputType->nameOf(i), outputNames[i]) << "at position " << i;
  }
}

class TableScanMatcher : public PlanMatcherImpl<plan::TableScanNode> {
 public:
  explicit TableScanMatcher(std::optional<std::string> tableName)
      : tableName_{std::move(tableName)} {}

  bool matchDetails(const plan::TableScanNode& plan) const override {
    SCOPED_TRACE(plan.toString(true, false));

    if (tableName_.has_value()) {
      EXPECT_EQ(plan.tableName(), tableName_.value());
    }

    REFIT_TEST_RETURN
  }

 private:
  const std::optional<std::string> tableName_;
};

class FilterMatcher : public PlanMatcherImpl<plan::FilterNode> {
 public:
  explicit FilterMatcher(const std::shared_ptr<PlanMatcher>& sourceMatcher)
      : PlanMatcherImpl<plan::FilterNode>(sourceMatcher) {}
};

class ProjectMatcher : public PlanMatcherImpl<plan::ProjectNode> {
 public:
  ProjectMatcher(
      const std::shared_ptr<PlanMatcher>& sourceMatcher,
      std::vector<std::string> outputNames)
      : PlanMatcherImpl<plan::ProjectNode>(sourceMatcher),
        outputNames_{std::move(outputNames)} {}

  bool matchDetails(const plan::ProjectNode& plan) const override {
    SCOPED_TRACE(plan.toString(true, false));

    expectOutputNames(plan, outputNames_);

    REFIT_TEST_RETURN
  }

 private:
  const std::vector<std::string> outputNames_;
};

class AggregateMatcher : public PlanMatcherImpl<plan::AggregateNode> {
 public:
  AggregateMatcher(
      const std::shared_ptr<PlanMatcher>& sourceMatcher,
      std::vector<std::string> outputNames,
      std::optional<plan::AggregationStep> step)
      : PlanMatcherImpl<plan::AggregateNode>(sourceMatcher),
        outputNames_{std::move(outputNames)},
        step_{step} {}

  bool matchDetails(const plan::AggregateNode& plan) const override {
    SCOPED_TRACE(plan.toString(true, false));

    if (step_.has_value()) {
      EXPECT_EQ(plan::toString(plan.step()), plan::toString(step_.value()));
    }

    expectOutputNames(plan, outputNames_);

    REFIT_TEST_RETURN
  }

 private:
  const std::vector<std::string> outputNames_;
  const std::optional<plan::AggregationStep> step_;
};

#undef REFIT_TEST_RETURN
#undef REFIT_TEST_RETURN_IF_FAILURE

} // namespace

PlanMatcherBuilder& PlanMatcherBuilder::tableScan() {
  VELOX_USER_CHECK_NULL(matcher_, "TableScan must be the first node");
  matcher_ = std::make_shared<TableScanMatcher>(std::nullopt);
  return *this;
}

PlanMatcherBuilder& PlanMatcherBuilder::tableScan(
    const std::string& tableName) {
  VELOX_USER_CHECK_NULL(matcher_, "TableScan must be the first node");
  matcher_ = std::make_shared<TableScanMatcher>(tableName);
  return *this;
}

PlanMatcherBuilder& PlanMatcherBuilder::filter() {
  VELOX_USER_CHECK_NOT_NULL(matcher_, "Filter cannot be the leaf node");
  matcher_ = std::make_shared<FilterMatcher>(matcher_);
  return *this;
}

PlanMatcherBuilder& PlanMatcherBuilder::project(
    const std::vector<std::string>& outputNames) {
  VELOX_USER_CHECK_NOT_NULL(matcher_, "Project cannot be the leaf node");
  matcher_ = std::make_shared<ProjectMatcher>(matcher_, outputNames);
  return *this;
}

PlanMatcherBuilder& PlanMatcherBuilder::aggregate(
    const std::vector<std::string>& outputNames,
    std::optional<plan::AggregationStep> step) {
  VELOX_USER_CHECK_NOT_NULL(matcher_, "Aggregate cannot be the leaf node");
  matcher_ = std::make_shared<AggregateMatcher>(matcher_, outputNames, step);
  return *this;
}

std::shared_ptr<PlanMatcher> PlanMatcherBuilder::build() {
  VELOX_USER_CHECK_NOT_NULL(matcher_, "Cannot build an empty PlanMatcher.");
  return matcher_;
}

} // namespace facebook::refit::optimizer::test
