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

#include "refit/plan/Attribute.h"
#include <fmt/format.h>
#include "velox/common/base/Exceptions.h"

namespace facebook::refit::plan {

bool Attribute::compatibleWith(const Attribute& other) const {
  VELOX_CHECK_NOT_NULL(type);
  VELOX_CHECK_NOT_NULL(other.type);
  return name == other.name && *type == *other.type;
}

std::string Attribute::toString() const {
  return fmt::format("{}:{}", name, type->toString());
}

velox::RowTypePtr toRowType(const AttributeVector& attributes) {
  std::vector<std::string> names;
  std::vector<velox::TypePtr> types;
  names.reserve(attributes.size());
  types.reserve(attributes.size());
  for (const auto& attribute : attributes) {
    names.push_back(attribute.name);
    types.push_back(attribute.type);
  }
  return velox::ROW(std::move(names), std::move(types));
}

AttributeVector toAttributes(const velox::RowType& rowType) {
  AttributeVector attributes;
  attributes.reserve(rowType.size());
  for (auto i = 0; i < rowType.size(); ++i) {
    attributes.push_back({rowType.nameOf(i), rowType.childAt(i)});
  }
  return attributes;
}

std::string toString(const AttributeVector& attributes) {
  std::string out = "[";
  for (auto i = 0; i < attributes.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += attributes[i].toString();
  }
  out += "]";
  return out;
}

std::string NamedExpr::toString() const {
  if (auto attribute = asAttributeReference(expr);
      attribute.has_value() && attribute->name == name) {
    return name;
  }
  return fmt::format("{} := {}", name, expr->toString());
}

NamedExpr toNamedExpr(const Attribute& attribute) {
  return {
      attribute.name,
      std::make_shared<velox::core::FieldAccessTypedExpr>(
          attribute.type, attribute.name)};
}

NamedExprVector toNamedExprs(const AttributeVector& attributes) {
  NamedExprVector exprs;
  exprs.reserve(attributes.size());
  for (const auto& attribute : attributes) {
    exprs.push_back(toNamedExpr(attribute));
  }
  return exprs;
}

const velox::core::TypedExprPtr& stripRenaming(const NamedExpr& expr) {
  return expr.expr;
}

std::optional<Attribute> asAttributeReference(
    const velox::core::TypedExprPtr& expr) {
  if (!expr->isFieldAccessKind()) {
    return std::nullopt;
  }

  const auto* field = expr->asUnchecked<velox::core::FieldAccessTypedExpr>();
  if (!field->isInputColumn()) {
    return std::nullopt;
  }
  return Attribute{field->name(), field->type()};
}

void collectInputColumns(
    const velox::core::TypedExprPtr& expr,
    AttributeVector& columns) {
  if (auto attribute = asAttributeReference(expr)) {
    columns.push_back(std::move(attribute.value()));
    return;
  }

  // Lambda bodies refer to lambda arguments, not to input columns.
  if (expr->isLambdaKind()) {
    return;
  }

  for (const auto& input : expr->inputs()) {
    collectInputColumns(input, columns);
  }
}

} // namespace facebook::refit::plan
