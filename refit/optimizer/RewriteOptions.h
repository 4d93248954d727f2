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

#include <cstdint>

namespace facebook::velox::config {
class ConfigBase;
}

namespace facebook::refit::optimizer {

/// Settings of the offload rewrite rules.
struct RewriteOptions {
  /// Trace flags. Log every post-projection inserted into a plan.
  static constexpr uint32_t kTraceRewrites = 1;

  /// Log every adaptation computed for offload validation.
  static constexpr uint32_t kTraceValidation = 2;

  static constexpr const char* kPullOutPostProjectEnabled =
      "refit.pull-out-post-project.enabled";
  static constexpr const char* kTraceFlags = "refit.trace-flags";

  /// If false, aggregates are never adapted and both entry points of the
  /// rule return their input as is.
  bool enablePullOutPostProject{true};

  /// Bitmask of kTraceXxx flags.
  uint32_t traceFlags{0};

  bool traceEnabled(uint32_t flag) const {
    return (traceFlags & flag) != 0;
  }

  /// Reads options from session or system properties. Properties that are
  /// not set keep their defaults.
  static RewriteOptions fromConfig(const velox::config::ConfigBase& config);
};

} // namespace facebook::refit::optimizer
