#ifndef FOUNDATIONAL_PROTO_IO_PROTO_IO_H_
#define FOUNDATIONAL_PROTO_IO_PROTO_IO_H_
// Reading and writing protos as text, either TextFormat or JSON.
// Failures are returned as absl::Status values
//   kUnavailable  the file could not be opened, read or written.
//   kDataLoss     the contents could not be parsed into the proto.

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "google/protobuf/message.h"

namespace proto_io {

// A file descriptor that gets closed when the object goes out of scope.
class AFile {
  private:
    int _fd;

  public:
    AFile(const std::string& fname, int mode);  // O_RDONLY or O_WRONLY...
    ~AFile();

    AFile(const AFile&) = delete;
    AFile& operator=(const AFile&) = delete;

    int good() const {
      return _fd >= 0;
    }

    int fd() const {
      return _fd;
    }

    // Close now rather than in the destructor, so errors can be seen.
    // Returns 0 on failure.
    int Close();
};

// True if `fname` should be treated as JSON rather than TextFormat.
bool IsJsonFileName(const std::string& fname);

absl::Status WriteTextProto(const google::protobuf::Message& proto, const std::string& fname);
absl::Status WriteJsonProto(const google::protobuf::Message& proto, const std::string& fname);

// Dispatches to WriteJsonProto if `fname` ends with .json
absl::Status WriteProto(const google::protobuf::Message& proto, const std::string& fname);

// The proto is cleared before reading.
absl::Status ReadTextProto(const std::string& fname, google::protobuf::Message& proto);
absl::Status ReadJsonProto(const std::string& fname, google::protobuf::Message& proto);

// Dispatches to ReadJsonProto if `fname` ends with .json
absl::Status ReadProtoInto(const std::string& fname, google::protobuf::Message& proto);

template <typename Proto>
absl::StatusOr<Proto>
ReadProto(const std::string& fname) {
  Proto result;
  absl::Status status = ReadProtoInto(fname, result);
  if (! status.ok()) {
    return status;
  }

  return result;
}

}  // namespace proto_io

#endif  // FOUNDATIONAL_PROTO_IO_PROTO_IO_H_
