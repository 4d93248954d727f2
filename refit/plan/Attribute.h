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

#include <optional>
#include <string>
#include <vector>
#include "velox/core/Expressions.h"
#include "velox/type/Type.h"

namespace facebook::refit::plan {

/// A named, typed column produced somewhere in the plan. Two attributes are
/// compatible when both name and type match exactly. The position of the
/// column in its producer's output plays no role.
struct Attribute {
  std::string name;
  velox::TypePtr type;

  bool compatibleWith(const Attribute& other) const;

  bool operator==(const Attribute& other) const {
    return compatibleWith(other);
  }

  std::string toString() const;
};

using AttributeVector = std::vector<Attribute>;

velox::RowTypePtr toRowType(const AttributeVector& attributes);

AttributeVector toAttributes(const velox::RowType& rowType);

std::string toString(const AttributeVector& attributes);

/// An expression together with the output name it contributes when it is a
/// top-level result column. A NamedExpr whose 'expr' is a bare input column is
/// a trivial renaming of that column.
struct NamedExpr {
  std::string name;
  velox::core::TypedExprPtr expr;

  Attribute toAttribute() const {
    return {name, expr->type()};
  }

  std::string toString() const;
};

using NamedExprVector = std::vector<NamedExpr>;

/// Makes a NamedExpr that refers to 'attribute' under its own name.
NamedExpr toNamedExpr(const Attribute& attribute);

NamedExprVector toNamedExprs(const AttributeVector& attributes);

/// Removes the renaming wrapper and returns the underlying expression.
/// Idempotent on the returned expression.
const velox::core::TypedExprPtr& stripRenaming(const NamedExpr& expr);

/// Returns the attribute referenced by 'expr' if 'expr' is a plain reference
/// to an input column, std::nullopt for anything else (calls, casts,
/// constants, struct field dereferences).
std::optional<Attribute> asAttributeReference(
    const velox::core::TypedExprPtr& expr);

/// Collects every input column referenced anywhere inside 'expr'. Lambda
/// bodies are not visited.
void collectInputColumns(
    const velox::core::TypedExprPtr& expr,
    AttributeVector& columns);

} // namespace facebook::refit::plan
