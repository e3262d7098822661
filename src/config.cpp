#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace rspan {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Interpret a YAML scalar as a number when the whole text is numeric.
 */
std::optional<nlohmann::json> yaml_scalar_number(const std::string &s) {
  try {
    std::size_t idx = 0;
    long long i = std::stoll(s, &idx, 0);
    if (idx == s.size())
      return nlohmann::json(i);
  } catch (const std::invalid_argument &) {
  } catch (const std::out_of_range &) {
  }
  try {
    std::size_t idx = 0;
    double d = std::stod(s, &idx);
    if (idx == s.size())
      return nlohmann::json(d);
  } catch (const std::invalid_argument &) {
  } catch (const std::out_of_range &) {
  }
  return std::nullopt;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * Scalars keep their boolean or numeric type where possible; sequences and
 * maps become JSON arrays and objects.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    if (auto number = yaml_scalar_number(s))
      return *number;
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * files expose the same flat keys as legacy flat ones.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"core", "parsing", "output", "logging"}) {
    merge_section(section);
  }

  return normalized;
}

std::pair<std::string, std::string> split_category(const std::string &raw) {
  auto pos = raw.find('=');
  if (pos == std::string::npos) {
    return {raw, "debug"};
  }
  return {raw.substr(0, pos), raw.substr(pos + 1)};
}

std::unordered_map<std::string, std::string>
parse_log_categories(const nlohmann::json &value) {
  std::unordered_map<std::string, std::string> categories;
  auto assign_category = [&categories](std::string name, std::string level) {
    if (name.empty()) {
      return;
    }
    if (level.empty()) {
      level = "debug";
    }
    categories[std::move(name)] = std::move(level);
  };
  if (value.is_object()) {
    for (const auto &[key, v] : value.items()) {
      if (v.is_string()) {
        assign_category(key, v.get<std::string>());
      } else if (v.is_null()) {
        assign_category(key, "debug");
      } else {
        config_log()->warn("Unsupported value for log category '{}'; "
                           "expected string or null",
                           key);
      }
    }
  } else if (value.is_array()) {
    for (const auto &item : value) {
      if (!item.is_string()) {
        continue;
      }
      auto [name, level] = split_category(item.get<std::string>());
      assign_category(std::move(name), std::move(level));
    }
  } else if (value.is_string()) {
    auto [name, level] = split_category(value.get<std::string>());
    assign_category(std::move(name), std::move(level));
  }
  return categories;
}

} // namespace

OutputFormat output_format_from_string(const std::string &name) {
  std::string lower = to_lower_copy(name);
  if (lower == "text") {
    return OutputFormat::Text;
  }
  if (lower == "json") {
    return OutputFormat::Json;
  }
  throw std::invalid_argument("Invalid output format: " + name);
}

const char *to_string(OutputFormat format) {
  return format == OutputFormat::Json ? "json" : "text";
}

/**
 * Apply every recognised key of @p j. Unknown keys are ignored.
 *
 * @throws nlohmann::json::exception When a value has the wrong type.
 * @throws std::runtime_error When an enumerated value is not recognised.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("strict_timestamps")) {
    set_parse_mode(cfg["strict_timestamps"].get<bool>()
                       ? TimestampParseMode::Strict
                       : TimestampParseMode::Lenient);
  }
  if (cfg.contains("parse_mode")) {
    try {
      set_parse_mode(
          parse_mode_from_string(cfg["parse_mode"].get<std::string>()));
    } catch (const std::invalid_argument &e) {
      config_log()->error("{}", e.what());
      throw std::runtime_error(e.what());
    }
  }
  if (cfg.contains("output_format")) {
    try {
      set_output_format(
          output_format_from_string(cfg["output_format"].get<std::string>()));
    } catch (const std::invalid_argument &e) {
      config_log()->error("{}", e.what());
      throw std::runtime_error(e.what());
    }
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    set_log_categories(parse_log_categories(cfg["log_categories"]));
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 * @throws nlohmann::json::exception When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be opened, parsed, or when
 *         the extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format");
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace rspan
