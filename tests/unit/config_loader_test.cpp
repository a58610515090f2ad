#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "masterplan_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\masterplan\\\"quoted\"\\db.sqlite"
storage:
  root_uri: "/srv/projects"
  scratch_dir: "/tmp/scratch"
)");

  auto config = masterplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\masterplan\\\"quoted\"\\db.sqlite");
  assert(config.storage().root_uri() == "/srv/projects");
}

void TestDefaultsFillOmittedSections() {
  const auto yaml_path = WriteYaml("defaults", R"(server:
  bind_address: "127.0.0.1:7000"
)");

  auto config = masterplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().has_memory());
  assert(config.tiles().tile_size() == 256);
  assert(config.tiles().format() == "png");
  assert(config.tiles().quality() == 90);
  assert(config.workers().job_threads() == 2);
  assert(config.workers().encode_threads() > 0);
  assert(config.geometry().label_precision() == 1.0);
  assert(config.geometry().curve_tolerance() == 0.5);
  assert(config.release().default_published_by() == "system");
  assert(config.logging().level() == "info");
  assert(!config.tracing().enabled());
  assert(config.tracing().service_name() == "masterplan-publisher");
}

void TestEmptyDocumentIsAllDefaults() {
  auto config = masterplan::config::ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.storage().root_uri() == "./data/projects");
}

void TestTileSettingsAreValidated() {
  bool threw = false;
  try {
    (void)masterplan::config::ConfigLoader::LoadFromYamlString(R"(tiles:
  tile_size: 256
  overlap: 256
  format: "webp"
)");
  } catch (const masterplan::util::ValidationError& e) {
    threw = true;
    assert(e.errors().size() == 2);
  }
  assert(threw && "overlap >= tile_size and an unknown format must both be reported.");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)masterplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestDefaultsFillOmittedSections();
  TestEmptyDocumentIsAllDefaults();
  TestTileSettingsAreValidated();
  TestUnknownFieldsAreRejected();

  std::cout << "masterplan_unit_config_loader: pass\n";
  return 0;
}
