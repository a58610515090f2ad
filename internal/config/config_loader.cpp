#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace masterplan::config {

using masterplan::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // An empty document means "all defaults".
  if (yaml.IsDefined() && !yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");

  auto* database = config->mutable_database();
  if (database->backend_case() == masterplan::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }

  auto* storage = config->mutable_storage();
  if (storage->root_uri().empty()) storage->set_root_uri("./data/projects");
  if (storage->scratch_dir().empty()) storage->set_scratch_dir("./data/scratch");

  auto* workers = config->mutable_workers();
  if (workers->job_threads() == 0) workers->set_job_threads(2);
  if (workers->encode_threads() == 0) {
    const unsigned hw = std::thread::hardware_concurrency();
    workers->set_encode_threads(hw == 0 ? 4 : hw);
  }

  auto* tiles = config->mutable_tiles();
  if (tiles->tile_size() == 0) tiles->set_tile_size(256);
  if (tiles->format().empty()) tiles->set_format("png");
  if (tiles->quality() == 0) tiles->set_quality(90);

  auto* geometry = config->mutable_geometry();
  if (geometry->label_precision() == 0.0) geometry->set_label_precision(1.0);
  if (geometry->curve_tolerance() == 0.0) geometry->set_curve_tolerance(0.5);

  auto* release = config->mutable_release();
  if (release->default_published_by().empty()) release->set_default_published_by("system");

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* tracing = config->mutable_tracing();
  if (tracing->service_name().empty()) tracing->set_service_name("masterplan-publisher");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::vector<std::string> errors;

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    errors.push_back("database.sqlite.path must not be empty");
  }

  const auto& tiles = config.tiles();
  if (tiles.tile_size() <= 0) {
    errors.push_back("tiles.tile_size must be positive");
  }
  if (tiles.overlap() < 0 || tiles.overlap() >= tiles.tile_size()) {
    errors.push_back("tiles.overlap must be in [0, tile_size)");
  }
  if (tiles.format() != "png" && tiles.format() != "jpeg" && tiles.format() != "jpg") {
    errors.push_back("tiles.format must be png or jpeg");
  }
  if (tiles.quality() < 1 || tiles.quality() > 100) {
    errors.push_back("tiles.quality must be in [1, 100]");
  }

  if (config.geometry().label_precision() <= 0.0) {
    errors.push_back("geometry.label_precision must be positive");
  }
  if (config.geometry().curve_tolerance() <= 0.0) {
    errors.push_back("geometry.curve_tolerance must be positive");
  }

  if (!errors.empty()) {
    throw masterplan::util::ValidationError(std::move(errors));
  }
}

} // namespace masterplan::config
