// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef WORKFORCE_BASE_STATUS_BUILDER_H_
#define WORKFORCE_BASE_STATUS_BUILDER_H_

#include <sstream>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace workforce {

// Accumulates an annotation for a status and converts back to absl::Status.
// Used by RETURN_IF_ERROR() so that callers can stream context:
//   RETURN_IF_ERROR(ReadProblem(path)) << "while loading " << path;
class StatusBuilder {
 public:
  explicit StatusBuilder(const absl::StatusCode code)
      : base_status_(code, /*msg=*/{}) {}

  explicit StatusBuilder(absl::Status status)
      : base_status_(std::move(status)) {}

  operator absl::Status() const {  // NOLINT
    const std::string annotation = ss_.str();
    if (annotation.empty()) return base_status_;
    if (base_status_.message().empty()) {
      return absl::Status(base_status_.code(), annotation);
    }
    return absl::Status(base_status_.code(),
                        absl::StrCat(base_status_.message(), "; ", annotation));
  }

  template <class T>
  StatusBuilder& operator<<(const T& t) {
    ss_ << t;
    return *this;
  }

 private:
  const absl::Status base_status_;
  std::ostringstream ss_;
};

inline StatusBuilder InvalidArgumentErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kInvalidArgument);
}

inline StatusBuilder InternalErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kInternal);
}

inline StatusBuilder UnimplementedErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kUnimplemented);
}

}  // namespace workforce

#endif  // WORKFORCE_BASE_STATUS_BUILDER_H_
