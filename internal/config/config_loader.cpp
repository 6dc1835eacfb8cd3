#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace labelq::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

static labelq::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  labelq::runtime::config::RuntimeConfig config;

  // an empty document is a valid, all-defaults config
  if (yaml.IsDefined() && !yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
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
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

labelq::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

labelq::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(labelq::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50051");
  }

  if (config.database().has_sqlite() && !config.database().sqlite().has_wal_mode()) {
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  }
  if (config.database().has_sqlite() && config.database().sqlite().busy_timeout_ms() == 0) {
    config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(5000);
  }
  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(16);
  }

  auto* leases = config.mutable_leases();
  if (!leases->has_reservation_timeout()) {
    leases->mutable_reservation_timeout()->set_seconds(300);
  }
  if (!leases->has_release_on_startup()) {
    leases->set_release_on_startup(true);
  }
  if (!leases->has_release_on_shutdown()) {
    leases->set_release_on_shutdown(true);
  }

  auto* images = config.mutable_images();
  if (images->extensions().empty()) {
    for (const char* ext : {"jpg", "jpeg", "png", "bmp", "gif", "webp"}) {
      images->add_extensions(ext);
    }
  }
  if (images->url_prefix().empty()) {
    images->set_url_prefix("/images/");
  }
  if (!images->has_rescan_on_next()) {
    images->set_rescan_on_next(false);
  }

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) {
    observability->set_service_name("labelq");
  }
  if (observability->metrics_interval_ms() == 0) {
    observability->set_metrics_interval_ms(1000);
  }

  for (auto& category : *config.mutable_categories()) {
    if (category.name().empty()) category.set_name(category.id());
    for (auto& label : *category.mutable_labels()) {
      if (label.name().empty()) label.set_name(label.id());
    }
  }
}

void ConfigLoader::Validate(const labelq::runtime::config::RuntimeConfig& config) {
  const auto& timeout = config.leases().reservation_timeout();
  if (timeout.seconds() < 0 || timeout.nanos() < 0) {
    throw std::runtime_error("Invalid configuration: leases.reservation_timeout must not be negative");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  std::set<std::string> category_ids;
  for (const auto& category : config.categories()) {
    if (category.id().empty()) {
      throw std::runtime_error("Invalid configuration: category without id");
    }
    if (!category_ids.insert(category.id()).second) {
      throw std::runtime_error("Invalid configuration: duplicate category id '" + category.id() + "'");
    }

    std::set<std::string> label_ids;
    for (const auto& label : category.labels()) {
      if (label.id().empty()) {
        throw std::runtime_error("Invalid configuration: label without id in category '" + category.id() + "'");
      }
      if (!label_ids.insert(label.id()).second) {
        throw std::runtime_error("Invalid configuration: duplicate label id '" + label.id() + "' in category '" +
                                 category.id() + "'");
      }
    }
  }
}

} // namespace labelq::config
