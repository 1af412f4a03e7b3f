//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

namespace resizelab {
namespace scope {
/**
 * @brief Run cleanup while another error is in flight. A failure of cleanup is logged and
 * dropped so that the in-flight error keeps priority.
 *
 * @param what name of the released resource, for the log line
 * @param cleanup
 */
template <typename Cleanup>
void ReleaseQuietly(std::string_view what, Cleanup&& cleanup) noexcept {
  try {
    std::forward<Cleanup>(cleanup)();
  } catch (const std::exception& e) {
    std::cerr << "[WARN] Cleanup: failed to release " << what << ": " << e.what() << std::endl;
  } catch (...) {
    std::cerr << "[WARN] Cleanup: failed to release " << what << ": unknown error" << std::endl;
  }
}

/**
 * @brief body, then cleanup whether or not body throws. Nest calls to get ordered teardown.
 *
 * If body throws, cleanup runs quietly and the body's error propagates unchanged. If only
 * cleanup throws, its error propagates.
 *
 * @param what name of the resource released by cleanup
 * @param body
 * @param cleanup
 */
template <typename Body, typename Cleanup>
void TryFinally(std::string_view what, Body&& body, Cleanup&& cleanup) {
  try {
    std::forward<Body>(body)();
  } catch (...) {
    ReleaseQuietly(what, cleanup);
    throw;
  }
  cleanup();
}
};  // namespace scope
};  // namespace resizelab
