#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/bytes.hpp"

namespace bridge::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars and hex strings stay strings
  const bool quoted = node.Tag() == "!";
  const bool hex    = scalar_value.size() > 1 && scalar_value[0] == '0' && (scalar_value[1] == 'x' || scalar_value[1] == 'X');
  if (quoted || hex) {
    value->set_string_value(scalar_value);
    return;
  }

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

static bridge::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  bridge::runtime::config::RuntimeConfig config;

  // An empty document is an all-defaults config.
  if (!yaml.IsNull()) {
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

bridge::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

bridge::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(bridge::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }
  if (!config.database().has_memory() && !config.database().has_sqlite()) {
    config.mutable_database()->mutable_memory();
  }

  auto* board = config.mutable_board();
  if (!board->has_claim_expiry_blocks()) board->set_claim_expiry_blocks(13);
  if (!board->has_replication_factor()) board->set_replication_factor(2);
  if (!board->has_activity_window_blocks()) board->set_activity_window_blocks(100);

  auto* gas = config.mutable_gas();
  if (gas->claim() == 0) gas->set_claim(187000);
  if (gas->inclusion() == 0) gas->set_inclusion(197000);
  if (gas->result() == 0) gas->set_result(137000);
  if (gas->block() == 0) gas->set_block(97000);

  if (!config.chain().has_block_interval_ms()) {
    config.mutable_chain()->set_block_interval_ms(15000);
  }
}

void ConfigLoader::Validate(const bridge::runtime::config::RuntimeConfig& config) {
  if (config.board().claim_expiry_blocks() == 0) {
    throw std::invalid_argument("board.claim_expiry_blocks must be positive");
  }
  if (config.board().replication_factor() == 0) {
    throw std::invalid_argument("board.replication_factor must be positive");
  }
  if (config.chain().block_interval_ms() == 0) {
    throw std::invalid_argument("chain.block_interval_ms must be positive");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path must be set");
  }
  for (const auto& reporter : config.reporters().bootstrap()) {
    try {
      util::AddressFromHex(reporter);
    } catch (const std::exception& e) {
      throw std::invalid_argument("reporters.bootstrap entry '" + reporter + "': " + e.what());
    }
  }
}

} // namespace bridge::config
