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

#include "workforce/base/file.h"

#include <cstdio>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "workforce/base/logging.h"

namespace workforce {
namespace file {

absl::StatusOr<std::string> GetContents(absl::string_view file_name) {
  const std::string name(file_name);
  FILE* const f = fopen(name.c_str(), "rb");
  if (f == nullptr) {
    return absl::NotFoundError(absl::StrCat("Could not open '", name, "'."));
  }
  std::string contents;
  char buffer[4096];
  size_t num_read;
  while ((num_read = fread(buffer, 1, sizeof(buffer), f)) > 0) {
    contents.append(buffer, num_read);
  }
  const bool read_error = ferror(f) != 0;
  fclose(f);
  if (read_error) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read from '", name, "'."));
  }
  return contents;
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents) {
  const std::string name(file_name);
  FILE* const f = fopen(name.c_str(), "wb");
  if (f == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not open '", name, "' for writing."));
  }
  const size_t written = fwrite(contents.data(), 1, contents.size(), f);
  const bool close_ok = fclose(f) == 0;
  if (written != contents.size() || !close_ok) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Could not write ", contents.size(), " bytes to '", name, "'."));
  }
  return absl::OkStatus();
}

absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto) {
  ASSIGN_OR_RETURN(const std::string contents, GetContents(file_name));
  if (!google::protobuf::TextFormat::ParseFromString(contents, proto)) {
    VLOG(1) << "Could not parse contents of '" << file_name << "'";
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse text proto from '", file_name, "'."));
  }
  return absl::OkStatus();
}

absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto) {
  std::string proto_string;
  if (!google::protobuf::TextFormat::PrintToString(proto, &proto_string)) {
    return absl::InternalError(
        absl::StrCat("Could not serialize ", proto.GetTypeName(), "."));
  }
  return SetContents(file_name, proto_string);
}

absl::Status GetBinaryProto(absl::string_view file_name,
                            google::protobuf::Message* proto) {
  ASSIGN_OR_RETURN(const std::string contents, GetContents(file_name));
  if (!proto->ParseFromString(contents)) {
    VLOG(1) << "Could not parse contents of '" << file_name << "'";
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse binary proto from '", file_name, "'."));
  }
  return absl::OkStatus();
}

absl::Status SetBinaryProto(absl::string_view file_name,
                            const google::protobuf::Message& proto) {
  std::string proto_string;
  if (!proto.SerializeToString(&proto_string)) {
    return absl::InternalError(
        absl::StrCat("Could not serialize ", proto.GetTypeName(), "."));
  }
  return SetContents(file_name, proto_string);
}

}  // namespace file
}  // namespace workforce
