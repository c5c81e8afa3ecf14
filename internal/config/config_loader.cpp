#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <vector>

#include "internal/model/direction.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace commute::config {

using commute::runtime::config::RuntimeConfig;
using commute::util::ConfigurationError;

static constexpr const char* kDefaultTimezone   = "America/New_York";
static constexpr const char* kDefaultDbPath     = "commute.db";
static constexpr const char* kDefaultGeocodeUrl = "https://maps.googleapis.com/maps/api/geocode/json";
static constexpr const char* kDefaultRoutesUrl  = "https://routes.googleapis.com/directions/v2:computeRoutes";

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("12345" as an api key)
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
      throw ConfigurationError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_provider()->set_geocode_url(kDefaultGeocodeUrl);
  config.mutable_provider()->set_routes_url(kDefaultRoutesUrl);
  config.mutable_schedule()->set_timezone(kDefaultTimezone);
  config.mutable_database()->mutable_sqlite()->set_path(kDefaultDbPath);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::ApplyEnvironment(const EnvLookup& env, RuntimeConfig* config) {
  auto get = [&env](const char* name) -> std::optional<std::string> {
    auto value = env(name);
    if (!value || value->empty()) return std::nullopt;
    return value;
  };

  if (auto v = get("GOOGLE_MAPS_API_KEY")) config->mutable_provider()->set_api_key(*v);
  if (auto v = get("GEOCODE_URL")) config->mutable_provider()->set_geocode_url(*v);
  if (auto v = get("ROUTES_URL")) config->mutable_provider()->set_routes_url(*v);

  if (auto v = get("HOME_LABEL")) config->mutable_home()->set_label(*v);
  if (auto v = get("HOME_ADDRESS")) config->mutable_home()->set_address(*v);
  if (auto v = get("WORK_LABEL")) config->mutable_work()->set_label(*v);
  if (auto v = get("WORK_ADDRESS")) config->mutable_work()->set_address(*v);

  if (auto v = get("LOCAL_TZ")) config->mutable_schedule()->set_timezone(*v);
  if (auto v = get("DIRECTION")) config->mutable_schedule()->set_force_direction(*v);

  if (auto v = get("DB_PATH")) config->mutable_database()->mutable_sqlite()->set_path(*v);
}

RuntimeConfig ConfigLoader::Load(const std::optional<std::string>& yaml_path, const EnvLookup& env) {
  auto config = Defaults();
  if (yaml_path) {
    config.MergeFrom(LoadFromYaml(*yaml_path));
  }
  ApplyEnvironment(env, &config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::vector<std::string> problems;

  auto require = [&problems](const std::string& value, const char* name) {
    if (value.empty()) problems.push_back(std::string("missing ") + name);
  };

  require(config.provider().api_key(), "GOOGLE_MAPS_API_KEY (provider.api_key)");
  require(config.provider().geocode_url(), "GEOCODE_URL (provider.geocode_url)");
  require(config.provider().routes_url(), "ROUTES_URL (provider.routes_url)");
  require(config.home().label(), "HOME_LABEL (home.label)");
  require(config.home().address(), "HOME_ADDRESS (home.address)");
  require(config.work().label(), "WORK_LABEL (work.label)");
  require(config.work().address(), "WORK_ADDRESS (work.address)");
  require(config.schedule().timezone(), "LOCAL_TZ (schedule.timezone)");

  if (!config.home().label().empty() && config.home().label() == config.work().label()) {
    problems.push_back("home and work labels must differ");
  }

  if (!config.schedule().timezone().empty()) {
    try {
      (void)util::LocateZone(config.schedule().timezone());
    } catch (const ConfigurationError& e) {
      problems.push_back(std::string("LOCAL_TZ: ") + e.what());
    }
  }

  const auto& forced = config.schedule().force_direction();
  if (!forced.empty() && !model::ParseDirection(forced)) {
    problems.push_back("DIRECTION must be H2W or W2H, got '" + forced + "'");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    problems.push_back("missing DB_PATH (database.sqlite.path)");
  }

  if (problems.empty()) return;

  std::ostringstream msg;
  msg << "invalid configuration:";
  for (const auto& problem : problems) msg << "\n  - " << problem;
  throw ConfigurationError(msg.str());
}

EnvLookup ConfigLoader::ProcessEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    if (const char* value = std::getenv(name.c_str())) return std::string(value);
    return std::nullopt;
  };
}

} // namespace commute::config
