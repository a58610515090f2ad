#include "manifest_codec.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"

namespace masterplan::release {

namespace v1 = masterplan::release::v1;

std::string ManifestToJson(const v1::ReleaseManifest& manifest) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(manifest, &json, options);
  if (!status.ok()) {
    throw util::InvalidState("manifest encode failed: " + std::string(status.message()));
  }
  return json;
}

v1::ReleaseManifest ManifestFromJson(std::string_view json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  v1::ReleaseManifest manifest;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &manifest, options);
  if (!status.ok()) {
    throw util::ValidationError("invalid release manifest: " + std::string(status.message()));
  }
  return manifest;
}

std::string CanonicalBytes(const v1::ReleaseManifest& manifest) {
  v1::ReleaseManifest body = manifest;
  body.clear_checksum();

  std::string bytes;
  {
    google::protobuf::io::StringOutputStream raw(&bytes);
    google::protobuf::io::CodedOutputStream  out(&raw);
    out.SetSerializationDeterministic(true);
    if (!body.SerializeToCodedStream(&out)) {
      throw util::InvalidState("manifest serialization failed");
    }
  }
  return bytes;
}

std::string ComputeChecksum(const v1::ReleaseManifest& manifest) {
  return util::Sha256Checksum(CanonicalBytes(manifest));
}

} // namespace masterplan::release
