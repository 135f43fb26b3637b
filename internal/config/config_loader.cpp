#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace elevator::config {

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";
constexpr int         kDefaultTotalFloors = 10;
constexpr double      kDefaultFloorMoveS  = 5.0;
constexpr double      kDefaultDoorTimeS   = 2.0;
constexpr uint32_t    kDefaultFleetSize   = 5;
constexpr const char* kDefaultIdPrefix    = "elevator-";
constexpr uint32_t    kDefaultWorkers     = 4;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // quoted scalars stay strings ("5" is a string, 5 is a number)
  if (node.Tag() != "!") {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (!scalar_value.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
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
  }
}

elevator::runtime::config::RuntimeConfig Parse(const YAML::Node& yaml) {
  elevator::runtime::config::RuntimeConfig config;

  // an empty document is a valid, all-default config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(&config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::ConfigurationError("configuration root must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ConfigurationError("invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

} // namespace

elevator::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

elevator::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(elevator::runtime::config::RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* building = config->mutable_building();
  if (!building->has_total_floors()) building->set_total_floors(kDefaultTotalFloors);
  if (!building->has_floor_move_time_s()) building->set_floor_move_time_s(kDefaultFloorMoveS);
  if (!building->has_door_open_close_time_s()) building->set_door_open_close_time_s(kDefaultDoorTimeS);

  auto* fleet = config->mutable_fleet();
  if (fleet->size() == 0) fleet->set_size(kDefaultFleetSize);
  if (fleet->id_prefix().empty()) fleet->set_id_prefix(kDefaultIdPrefix);

  if (config->engine().worker_threads() == 0) {
    config->mutable_engine()->set_worker_threads(kDefaultWorkers);
  }

  if (!config->database().has_memory() && !config->database().has_sqlite()) {
    config->mutable_database()->mutable_memory();
  }
}

} // namespace elevator::config
