#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace assetdiff::config {

using assetdiff::runtime::config::RuntimeConfig;

namespace {

constexpr uint64_t kDefaultSegmentBytes  = 16ull * 1024 * 1024;
constexpr uint64_t kDefaultDetailCeiling = 55'000;
constexpr uint64_t kDefaultReportCeiling = 60'000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
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
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*struct_value->mutable_fields())[entry.first.Scalar()]);
      }
      break;
    }
  }
}

} // namespace

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

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("127.0.0.1:50061");
  }

  auto* queue = config.mutable_queue();
  if (queue->directory().empty()) queue->set_directory("jobs");
  if (queue->segment_bytes() == 0) queue->set_segment_bytes(kDefaultSegmentBytes);
  if (!queue->has_fsync()) queue->set_fsync(true);

  auto* repositories = config.mutable_repositories();
  if (repositories->clone_root().empty()) repositories->set_clone_root("repos");
  if (repositories->remote_url_template().empty()) repositories->set_remote_url_template("https://github.com/{repo}.git");
  if (repositories->branch_prefix().empty()) repositories->set_branch_prefix("mdb");
  if (!repositories->has_fetch_pull_refs()) repositories->set_fetch_pull_refs(true);

  auto* output = config.mutable_output();
  if (output->root().empty()) output->set_root("images");

  auto* report = config.mutable_report();
  if (report->root().empty()) report->set_root("reports");
  if (report->detail_ceiling() == 0) report->set_detail_ceiling(kDefaultDetailCeiling);
  if (report->report_ceiling() == 0) report->set_report_ceiling(kDefaultReportCeiling);
  if (report->title().empty()) report->set_title("Asset difference rendering");
  if (report->summary().empty()) report->set_summary("Assets with diff:");

  auto* asset_tool = config.mutable_asset_tool();
  if (asset_tool->command().empty()) asset_tool->set_command("assetdiff-tool");
  if (asset_tool->sprite_extensions().empty()) asset_tool->add_sprite_extensions(".dmi");
  if (asset_tool->map_extensions().empty()) asset_tool->add_map_extensions(".dmm");
  if (asset_tool->render_workers() == 0) asset_tool->set_render_workers(4);

  auto* maintenance = config.mutable_maintenance();
  if (maintenance->daily_at().empty()) maintenance->set_daily_at("11:30");
  if (maintenance->retention_days() == 0) maintenance->set_retention_days(30);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.report().detail_ceiling() >= config.report().report_ceiling()) {
    throw util::InvalidArgument("report.detail_ceiling must be below report.report_ceiling");
  }

  if (!util::ParseDailyAt(config.maintenance().daily_at())) {
    throw util::InvalidArgument("maintenance.daily_at must be HH:MM, got '" + config.maintenance().daily_at() + "'");
  }

  if (config.repositories().remote_url_template().find("{repo}") == std::string::npos) {
    throw util::InvalidArgument("repositories.remote_url_template must contain {repo}");
  }
}

} // namespace assetdiff::config
