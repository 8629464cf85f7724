#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <utility>

#include "internal/net/network_range.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/vendor_passive_probe.hpp"
#include "internal/util/errors.hpp"

namespace scout::config {

using scout::runtime::config::RuntimeConfig;

namespace {
constexpr double kDefaultSeedShare        = 0.34;
constexpr double kDefaultFingerprintShare = 0.33;
} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings: service_name: "404" must not become a number.
  if (node.Tag() == "!") {
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
    case YAML::NodeType::Undefined:
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
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // An empty document is a valid, all-defaults configuration.
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::InvalidArgument("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

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
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& discovery = config.discovery();

  if (!discovery.network_range().empty()) {
    net::NetworkRange::Parse(discovery.network_range());
  }
  if (discovery.timeout_seconds() < 0) {
    throw util::InvalidArgument("discovery.timeout_seconds must not be negative");
  }

  const double seed = discovery.has_seed_share() ? discovery.seed_share() : kDefaultSeedShare;
  const double fp   = discovery.has_fingerprint_share() ? discovery.fingerprint_share() : kDefaultFingerprintShare;
  if (seed < 0 || seed >= 1 || fp < 0 || fp >= 1 || seed + fp >= 1) {
    throw util::InvalidArgument("discovery.seed_share and fingerprint_share must be in [0,1) and sum below 1");
  }

  for (auto port : config.probes().active_scan().ports()) {
    if (port == 0 || port > 65535) {
      throw util::InvalidArgument("probes.active_scan.ports: invalid port " + std::to_string(port));
    }
  }
  for (auto port : config.probes().protocol_fingerprint().http_ports()) {
    if (port == 0 || port > 65535) {
      throw util::InvalidArgument("probes.protocol_fingerprint.http_ports: invalid port " + std::to_string(port));
    }
  }
  if (config.probes().protocol_fingerprint().modbus_port() > 65535) {
    throw util::InvalidArgument("probes.protocol_fingerprint.modbus_port out of range");
  }

  const auto& scoring = config.scoring();
  const std::pair<const char*, std::optional<double>> weights[] = {
      {"base_presence", scoring.has_base_presence() ? std::optional(scoring.base_presence()) : std::nullopt},
      {"mac_vendor_match", scoring.has_mac_vendor_match() ? std::optional(scoring.mac_vendor_match()) : std::nullopt},
      {"service_announcement", scoring.has_service_announcement() ? std::optional(scoring.service_announcement()) : std::nullopt},
      {"device_description", scoring.has_device_description() ? std::optional(scoring.device_description()) : std::nullopt},
      {"protocol_fingerprint", scoring.has_protocol_fingerprint() ? std::optional(scoring.protocol_fingerprint()) : std::nullopt},
      {"vendor_passive", scoring.has_vendor_passive() ? std::optional(scoring.vendor_passive()) : std::nullopt},
      {"agreement_bonus", scoring.has_agreement_bonus() ? std::optional(scoring.agreement_bonus()) : std::nullopt},
      {"recognized_device_type", scoring.has_recognized_device_type() ? std::optional(scoring.recognized_device_type()) : std::nullopt},
  };
  for (const auto& [name, weight] : weights) {
    // NaN fails too.
    if (weight && !(*weight >= 0 && *weight <= 1)) {
      throw util::InvalidArgument(std::string("scoring.") + name + " must be within [0,1]");
    }
  }

  const auto& catalog = probe::DefaultVendorFamilies();
  for (const auto& family : config.probes().vendor_passive().families()) {
    const bool known = std::any_of(catalog.begin(), catalog.end(), [&](const probe::VendorFamily& entry) { return entry.name == family; });
    if (!known) {
      throw util::InvalidArgument("probes.vendor_passive.families: unknown family " + family);
    }
  }

  if (!config.logging().level().empty()) {
    try {
      observability::ParseLogLevel(config.logging().level());
    } catch (const util::InvalidArgument& e) {
      throw util::InvalidArgument(std::string("logging.level: ") + e.what());
    }
  }

  if (config.classifier().has_relevance_threshold()) {
    const double threshold = config.classifier().relevance_threshold();
    if (threshold < 0 || threshold > 1) {
      throw util::InvalidArgument("classifier.relevance_threshold must be within [0,1]");
    }
  }
}

} // namespace scout::config
