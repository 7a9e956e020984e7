// Text and JSON proto reading and writing.

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/json_util.h"

#include "Foundational/proto_io/proto_io.h"

namespace proto_io {

using google::protobuf::Message;

AFile::AFile(const std::string& fname, int mode) {
  const int flags = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
  _fd = ::open(fname.c_str(), mode, flags);
}

AFile::~AFile() {
  if (_fd >= 0) {
    ::close(_fd);
  }
}

int
AFile::Close() {
  if (_fd < 0) {
    return 0;
  }

  const int rc = ::close(_fd);
  _fd = -1;

  return rc == 0;
}

namespace {

std::string
ErrnoString() {
  return std::strerror(errno);
}

// Write all of `contents` to `fd`, retrying short writes.
int
WriteAll(int fd, const std::string& contents) {
  const char* p = contents.data();
  size_t remaining = contents.size();
  while (remaining > 0) {
    const ssize_t written = ::write(fd, p, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return 0;
    }
    p += written;
    remaining -= static_cast<size_t>(written);
  }

  return 1;
}

int
ReadAll(int fd, std::string& contents) {
  contents.clear();

  char buffer[8192];
  while (true) {
    const ssize_t nread = ::read(fd, buffer, sizeof(buffer));
    if (nread == 0) {
      return 1;
    }
    if (nread < 0) {
      if (errno == EINTR) {
        continue;
      }
      return 0;
    }
    contents.append(buffer, static_cast<size_t>(nread));
  }
}

}  // namespace

bool
IsJsonFileName(const std::string& fname) {
  return absl::EndsWith(fname, ".json");
}

absl::Status
WriteTextProto(const Message& proto, const std::string& fname) {
  AFile output(fname, O_WRONLY | O_TRUNC | O_CREAT);
  if (! output.good()) {
    return absl::UnavailableError(absl::StrCat("WriteTextProto:cannot open '", fname, "' ", ErrnoString()));
  }

  {
    google::protobuf::io::FileOutputStream zero_copy_output(output.fd());
    if (! google::protobuf::TextFormat::Print(proto, &zero_copy_output) ||
        ! zero_copy_output.Flush()) {
      return absl::UnavailableError(absl::StrCat("WriteTextProto:cannot write '", fname, "'"));
    }
  }

  if (! output.Close()) {
    return absl::UnavailableError(absl::StrCat("WriteTextProto:cannot close '", fname, "' ", ErrnoString()));
  }

  return absl::OkStatus();
}

absl::Status
WriteJsonProto(const Message& proto, const std::string& fname) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  // Zero values must survive a round trip for fields with presence.
  options.always_print_primitive_fields = true;

  std::string as_json;
  const auto status = google::protobuf::util::MessageToJsonString(proto, &as_json, options);
  if (! status.ok()) {
    return absl::InternalError(absl::StrCat("WriteJsonProto:cannot convert to json ", status.ToString()));
  }

  AFile output(fname, O_WRONLY | O_TRUNC | O_CREAT);
  if (! output.good()) {
    return absl::UnavailableError(absl::StrCat("WriteJsonProto:cannot open '", fname, "' ", ErrnoString()));
  }

  if (! WriteAll(output.fd(), as_json) || ! output.Close()) {
    return absl::UnavailableError(absl::StrCat("WriteJsonProto:cannot write '", fname, "' ", ErrnoString()));
  }

  return absl::OkStatus();
}

absl::Status
WriteProto(const Message& proto, const std::string& fname) {
  if (IsJsonFileName(fname)) {
    return WriteJsonProto(proto, fname);
  }

  return WriteTextProto(proto, fname);
}

absl::Status
ReadTextProto(const std::string& fname, Message& proto) {
  proto.Clear();

  AFile input(fname, O_RDONLY);
  if (! input.good()) {
    return absl::UnavailableError(absl::StrCat("ReadTextProto:cannot open '", fname, "' ", ErrnoString()));
  }

  google::protobuf::io::FileInputStream zero_copy_input(input.fd());
  if (! google::protobuf::TextFormat::Parse(&zero_copy_input, &proto)) {
    if (zero_copy_input.GetErrno() != 0) {
      return absl::UnavailableError(absl::StrCat("ReadTextProto:cannot read '", fname, "'"));
    }
    return absl::DataLossError(absl::StrCat("ReadTextProto:cannot parse '", fname, "'"));
  }

  return absl::OkStatus();
}

absl::Status
ReadJsonProto(const std::string& fname, Message& proto) {
  proto.Clear();

  AFile input(fname, O_RDONLY);
  if (! input.good()) {
    return absl::UnavailableError(absl::StrCat("ReadJsonProto:cannot open '", fname, "' ", ErrnoString()));
  }

  std::string file_contents;
  if (! ReadAll(input.fd(), file_contents)) {
    return absl::UnavailableError(absl::StrCat("ReadJsonProto:cannot read '", fname, "' ", ErrnoString()));
  }

  google::protobuf::util::JsonParseOptions options;
  const auto status = google::protobuf::util::JsonStringToMessage(file_contents, &proto, options);
  if (! status.ok()) {
    return absl::DataLossError(absl::StrCat("ReadJsonProto:cannot parse '", fname, "' ", status.ToString()));
  }

  return absl::OkStatus();
}

absl::Status
ReadProtoInto(const std::string& fname, Message& proto) {
  if (IsJsonFileName(fname)) {
    return ReadJsonProto(fname, proto);
  }

  return ReadTextProto(fname, proto);
}

}  // namespace proto_io
