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
#include <utility>

namespace facebook::refit::plan {

/// Records whether a plan node may be offloaded to the native engine.
struct TransformHint {
  enum class Kind {
    kTransformable,
    kNotTransformable,
  };

  Kind kind;

  /// Why the node was excluded. Empty for kTransformable.
  std::string reason;

  bool operator==(const TransformHint& other) const = default;
};

/// Out-of-band annotations attached to a plan node. Tags are not part of the
/// node's structure: they do not show up in toString() and are not compared
/// when matching plans.
class NodeTags {
 public:
  const std::optional<TransformHint>& transformHint() const {
    return transformHint_;
  }

  void setTransformHint(TransformHint hint) {
    transformHint_ = std::move(hint);
  }

  void unsetTransformHint() {
    transformHint_.reset();
  }

  bool empty() const {
    return !transformHint_.has_value();
  }

  /// Replaces all tags with the ones in 'other'.
  void copyFrom(const NodeTags& other) {
    *this = other;
  }

  bool operator==(const NodeTags& other) const = default;

 private:
  std::optional<TransformHint> transformHint_;
};

} // namespace facebook::refit::plan
