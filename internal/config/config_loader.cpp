#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace favorites::config {

using favorites::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
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

  RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top-level YAML node must be a mapping");
  }

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

  ApplyDefaults(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  const auto scratch = std::filesystem::temp_directory_path() / "favorites";

  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level("info");
  }

  if (config.store().backend_case() == favorites::runtime::config::StoreConfig::BACKEND_NOT_SET) {
    config.mutable_store()->mutable_sqlite()->set_path("favorites.db");
  }
  if (config.store().has_sqlite() && config.store().sqlite().path().empty()) {
    config.mutable_store()->mutable_sqlite()->set_path("favorites.db");
  }

  if (config.workers().threads() == 0) {
    config.mutable_workers()->set_threads(2);
  }

  auto* exporter = config.mutable_exporter();
  if (exporter->directory().empty()) {
    exporter->set_directory((scratch / "saved").string());
  }
  if (exporter->file_basename().empty()) {
    exporter->set_file_basename("favorites-export");
  }
  if (exporter->document_title().empty()) {
    exporter->set_document_title("Saved Stories");
  }
  if (exporter->discussion_url_template().empty()) {
    exporter->set_discussion_url_template("https://news.ycombinator.com/item?id={id}");
  }
  if (!exporter->has_share_delay_ms()) {
    exporter->set_share_delay_ms(1500);
  }

  auto* downloads = config.mutable_downloads();
  if (downloads->mode() == favorites::runtime::config::DOWNLOADS_MODE_UNSPECIFIED) {
    downloads->set_mode(favorites::runtime::config::DOWNLOADS_MODE_SCOPED);
  }
  if (downloads->relative_path().empty()) {
    downloads->set_relative_path("Downloads");
  }
  if (downloads->media_root().empty()) {
    downloads->set_media_root((scratch / "media").string());
  }
}

} // namespace favorites::config
