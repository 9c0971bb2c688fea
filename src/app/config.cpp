#include <kensa/app/config.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace kensa::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value) {
  if (value == "true" || value == "1" || value == "on" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "off" || value == "no") return false;
  throw std::invalid_argument("not a boolean: " + value);
}

/// std::stoul accepts "-1" and wraps it; counts and sizes must not be negative.
unsigned long parse_unsigned(const std::string& value) {
  if (value.find('-') != std::string::npos) {
    throw std::invalid_argument("negative value: " + value);
  }
  return std::stoul(value);
}

std::uint32_t parse_size(const std::string& value) {
  const unsigned long v = parse_unsigned(value);
  if (v > std::numeric_limits<std::uint32_t>::max()) {
    throw std::out_of_range("size too large: " + value);
  }
  return static_cast<std::uint32_t>(v);
}

ClassifierBackendType parse_backend(const std::string& value) {
  if (value == "none") return ClassifierBackendType::None;
  if (value == "mock") return ClassifierBackendType::Mock;
  if (value == "onnx") return ClassifierBackendType::Onnx;
  throw std::invalid_argument("unknown classifier backend: " + value);
}

/// Applies one key to \p c. Returns false for an unknown key; throws on a bad value.
bool apply(InspectionConfig& c, const std::string& key, const std::string& value) {
  if (key == "scoring_mode") {
    auto mode = parse_scoring_mode(value);
    if (!mode) throw std::invalid_argument("unknown scoring mode: " + value);
    c.scoring_mode = *mode;
  }
  else if (key == "blur_kernel_size") c.features.blur_kernel_size = std::stoi(value);
  else if (key == "use_clahe") c.features.use_clahe = parse_bool(value);
  else if (key == "clahe_clip_limit") c.features.clahe_clip_limit = std::stod(value);
  else if (key == "clahe_tile_size") c.features.clahe_tile_size = std::stoi(value);
  else if (key == "closing_kernel_size") c.features.closing_kernel_size = std::stoi(value);
  else if (key == "min_region_area") c.min_region_area = std::stod(value);
  else if (key == "max_defect_fraction") c.scoring.max_defect_fraction = std::stod(value);
  else if (key == "edge_impact_multiplier") c.scoring.edge_impact_multiplier = std::stod(value);
  else if (key == "health_floor") c.scoring.health_floor = std::stod(value);
  else if (key == "health_ceiling") c.scoring.health_ceiling = std::stod(value);
  else if (key == "uncertain_lower") c.decision.uncertain_lower = std::stod(value);
  else if (key == "uncertain_upper") c.decision.uncertain_upper = std::stod(value);
  else if (key == "pass_health_threshold") c.decision.pass_health_threshold = std::stod(value);
  else if (key == "max_allowed_defects") c.decision.max_allowed_defects = parse_unsigned(value);
  else if (key == "classifier_fail_threshold") c.decision.classifier_fail_threshold = std::stod(value);
  else if (key == "classifier_input_width") c.classifier_input_width = parse_size(value);
  else if (key == "classifier_input_height") c.classifier_input_height = parse_size(value);
  else if (key == "gatekeeper_backend") c.gatekeeper.backend = parse_backend(value);
  else if (key == "gatekeeper_model_path") c.gatekeeper.model_path = value;
  else if (key == "gatekeeper_mock_probability") c.gatekeeper.mock_probability = std::stod(value);
  else if (key == "defect_backend") c.defect_classifier.backend = parse_backend(value);
  else if (key == "defect_model_path") c.defect_classifier.model_path = value;
  else if (key == "defect_mock_probability") c.defect_classifier.mock_probability = std::stod(value);
  else return false;
  return true;
}

}  // namespace

std::optional<kensa::core::ScoringMode> parse_scoring_mode(std::string_view name) {
  if (name == "geometric") return kensa::core::ScoringMode::Geometric;
  if (name == "edge_density") return kensa::core::ScoringMode::EdgeDensity;
  if (name == "classifier") return kensa::core::ScoringMode::Classifier;
  return std::nullopt;
}

InspectionConfig default_config() {
  return InspectionConfig{};
}

InspectionConfig load_config(const std::string& path) {
  InspectionConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config: cannot open {}, using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    try {
      if (!apply(c, key, value)) {
        spdlog::warn("config: {}:{}: unknown key '{}'", path, line_no, key);
      }
    } catch (const std::logic_error& e) {
      // std::invalid_argument and std::out_of_range from the parsers.
      spdlog::warn("config: {}:{}: bad value for '{}': {}", path, line_no, key, e.what());
    }
  }
  return c;
}

std::expected<void, kensa::core::InspectionError> validate_config(const InspectionConfig& c) {
  const auto& d = c.decision;
  const auto& s = c.scoring;
  const bool ok = kensa::vision::is_valid(c.features) && c.min_region_area >= 0.0 &&
                  s.max_defect_fraction > 0.0 && s.edge_impact_multiplier >= 0.0 &&
                  s.health_floor >= 0.0 && s.health_floor <= s.health_ceiling &&
                  s.health_ceiling <= 100.0 && d.uncertain_lower >= 0.0 &&
                  d.uncertain_lower <= d.uncertain_upper && d.uncertain_upper <= 1.0 &&
                  d.classifier_fail_threshold >= 0.0 && d.classifier_fail_threshold <= 1.0 &&
                  c.classifier_input_width > 0 && c.classifier_input_height > 0;
  if (!ok) {
    return std::unexpected(kensa::core::InspectionError::InvalidConfig);
  }
  return {};
}

}  // namespace kensa::app
