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

#include "refit/optimizer/RewriteOptions.h"
#include "velox/common/config/Config.h"

namespace facebook::refit::optimizer {

// static
RewriteOptions RewriteOptions::fromConfig(
    const velox::config::ConfigBase& config) {
  RewriteOptions defaults;

  RewriteOptions options;
  options.enablePullOutPostProject = config.get<bool>(
      kPullOutPostProjectEnabled, defaults.enablePullOutPostProject);
  options.traceFlags = config.get<uint32_t>(kTraceFlags, defaults.traceFlags);
  return options;
}

} // namespace facebook::refit::optimizer
