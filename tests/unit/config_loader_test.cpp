#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "skycache_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullDocument() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
storage:
  sqlite:
    path: "C:\\sky\\\"quoted\"\\cache.db"
naming:
  cache_prefix: sky-
  layer_prefix: sky-offline-
network:
  data_origin: https://stellarium-web.org
  request_timeout_ms: 5000
  start_offline: true
compression:
  min_size_bytes: 2048
hips:
  batch_size: 4
  surveys:
    - id: CDS/P/Fermi/color
      name: Fermi
      url: https://alasky.cds.unistra.fr/Fermi/Color/
      max_order: 3
      tile_format: jpeg
unified:
  default_ttl_ms: 1000
  url_patterns: [celestrak.org, "/stellarium-data/"]
)");

  auto config = skycache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.storage().sqlite().path() == "C:\\sky\\\"quoted\"\\cache.db");
  assert(config.naming().cache_prefix() == "sky-");
  assert(config.network().data_origin() == "https://stellarium-web.org");
  assert(config.network().request_timeout_ms() == 5000);
  assert(config.network().start_offline());
  assert(config.compression().min_size_bytes() == 2048);
  assert(config.hips().batch_size() == 4);
  assert(config.hips().surveys_size() == 1);
  assert(config.hips().surveys(0).id() == "CDS/P/Fermi/color");
  assert(config.hips().surveys(0).max_order() == 3);
  assert(config.unified().default_ttl_ms() == 1000);
  assert(config.unified().url_patterns_size() == 2);
  assert(config.unified().url_patterns(1) == "/stellarium-data/");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = skycache::config::ConfigLoader::LoadFromYamlString("");
  assert(config.storage().sqlite().path().empty());
  assert(!config.storage().disabled());
  assert(config.unified().url_patterns_size() == 0);
}

void TestQuotedNumbersStayStrings() {
  auto config = skycache::config::ConfigLoader::LoadFromYamlString(R"(network:
  user_agent: "12345"
)");
  assert(config.network().user_agent() == "12345");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(storage:
  sqlite:
    path: /tmp/sky.db
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)skycache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)skycache::config::ConfigLoader::LoadFromYaml("/nonexistent/skycache.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullDocument();
  TestEmptyDocumentYieldsDefaults();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileThrows();

  std::cout << "skycache_unit_config_loader: pass\n";
  return 0;
}
