#include <deductly/app/config.hpp>
#include <deductly/core/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace deductly::app {

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

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void warn_bad_value(const std::string& key, const std::string& value) {
  deductly::core::log::logger()->warn("config: ignoring invalid value '{}' for {}", value, key);
}

void set_bool(const std::string& key, const std::string& value, bool& out) {
  const auto v = lower(value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    out = true;
  } else if (v == "false" || v == "0" || v == "no" || v == "off") {
    out = false;
  } else {
    warn_bad_value(key, value);
  }
}

template <typename T, typename Parse>
void set_number(const std::string& key, const std::string& value, T& out, Parse parse) {
  try {
    std::size_t used = 0;
    const auto parsed = parse(value, &used);
    if (used != value.size()) {
      warn_bad_value(key, value);
      return;
    }
    out = static_cast<T>(parsed);
  } catch (const std::invalid_argument&) {
    warn_bad_value(key, value);
  } catch (const std::out_of_range&) {
    warn_bad_value(key, value);
  }
}

void set_int(const std::string& key, const std::string& value, int& out) {
  set_number(key, value, out,
             [](const std::string& s, std::size_t* used) { return std::stoi(s, used); });
}

void set_uint(const std::string& key, const std::string& value, std::uint32_t& out) {
  if (!value.empty() && value.front() == '-') {
    warn_bad_value(key, value);
    return;
  }
  set_number(key, value, out,
             [](const std::string& s, std::size_t* used) { return std::stoul(s, used); });
}

template <typename T>
void set_real(const std::string& key, const std::string& value, T& out) {
  set_number(key, value, out,
             [](const std::string& s, std::size_t* used) { return std::stod(s, used); });
}

}  // namespace

std::optional<RecognizerType> parse_recognizer_type(std::string_view name) {
  const auto v = lower(std::string(name));
  if (v == "mock") return RecognizerType::Mock;
  if (v == "tesseract") return RecognizerType::Tesseract;
  return std::nullopt;
}

ScannerConfig default_config() {
  ScannerConfig c;
  c.recognizer = RecognizerType::Mock;
  c.tesseract.language = "eng";
  c.tesseract.page_seg_mode = 6;
  c.confidence_strategy = deductly::analysis::ConfidenceStrategyKind::HeuristicText;
  c.quality_warning_threshold = 0.3f;
  c.log_level = "info";
  return c;
}

std::expected<ScannerConfig, deductly::core::ScanError> load_config(const std::string& path) {
  ScannerConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    deductly::core::log::logger()->error("config: cannot open {}", path);
    return std::unexpected(deductly::core::ScanError::InvalidConfig);
  }

  auto& pre = c.preprocess;
  auto& ext = c.extraction;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "recognizer") {
      if (auto type = parse_recognizer_type(value)) c.recognizer = *type;
      else warn_bad_value(key, value);
    }
    else if (key == "mock_text_file") c.mock_text_file = value;
    else if (key == "tesseract_data_path") c.tesseract.data_path = value;
    else if (key == "tesseract_language") c.tesseract.language = value;
    else if (key == "tesseract_psm") set_int(key, value, c.tesseract.page_seg_mode);
    else if (key == "tesseract_whitelist") c.tesseract.char_whitelist = value;
    else if (key == "confidence_strategy") {
      if (auto kind = deductly::analysis::parse_strategy_kind(value)) c.confidence_strategy = *kind;
      else warn_bad_value(key, value);
    }
    else if (key == "enable_crop") set_bool(key, value, pre.enable_crop);
    else if (key == "resize_target_height") set_uint(key, value, pre.resize_target_height);
    else if (key == "enable_denoise") set_bool(key, value, pre.enable_denoise);
    else if (key == "bilateral_diameter") set_int(key, value, pre.bilateral_diameter);
    else if (key == "bilateral_sigma") set_real(key, value, pre.bilateral_sigma);
    else if (key == "median_kernel") set_int(key, value, pre.median_kernel);
    else if (key == "enable_contrast") set_bool(key, value, pre.enable_contrast);
    else if (key == "clahe_clip_limit") set_real(key, value, pre.clahe_clip_limit);
    else if (key == "clahe_tile_grid") set_int(key, value, pre.clahe_tile_grid);
    else if (key == "enable_deskew") set_bool(key, value, pre.enable_deskew);
    else if (key == "deskew_threshold_degrees") set_real(key, value, pre.deskew_threshold_degrees);
    else if (key == "enable_binarize") set_bool(key, value, pre.enable_binarize);
    else if (key == "adaptive_block_size") set_int(key, value, pre.adaptive_block_size);
    else if (key == "adaptive_c") set_real(key, value, pre.adaptive_c);
    else if (key == "enable_morphology") set_bool(key, value, pre.enable_morphology);
    else if (key == "morphology_kernel") set_int(key, value, pre.morphology_kernel);
    else if (key == "quality_warning_threshold") set_real(key, value, c.quality_warning_threshold);
    else if (key == "min_year") set_int(key, value, ext.min_year);
    else if (key == "max_year") set_int(key, value, ext.max_year);
    else if (key == "exclude_summary_lines") set_bool(key, value, ext.exclude_summary_lines);
    else if (key == "deduplicate_items") set_bool(key, value, ext.deduplicate_items);
    else if (key == "log_level") c.log_level = lower(value);
  }
  return c;
}

}  // namespace deductly::app
