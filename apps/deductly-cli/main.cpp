/**
 * deductly-cli: scan receipt image(s); print structured records as JSON.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/deductly_cli [--config path] [--input path]...
 * Each input also writes its result to output/<basename>.json.
 */

#include <deductly/analysis/confidence_scorer.hpp>
#include <deductly/app/config.hpp>
#include <deductly/app/receipt_scanner.hpp>
#include <deductly/app/scanner_builder.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/log.hpp>
#include <deductly/core/serialization.hpp>
#include <deductly/vision/load_image.hpp>
#include <nlohmann/json.hpp>

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: deductly_cli [options] --input <image> [--input <image> ...]\n"
            << "  --config <path>          Scanner config (key=value file); default: built-in\n"
            << "  --recognizer <type>      Override recognizer: mock | tesseract\n"
            << "  --text-file <path>       Canned text for the mock recognizer\n"
            << "  --strategy <name>        Confidence strategy: heuristic | presence\n"
            << "  --save-processed <path>  Write the preprocessed image of the first input\n"
            << "  --validate               Also print validation problems for each record\n"
            << "  --input <path>           Receipt image (repeatable)\n"
            << "\nRecognizer selection: config file (recognizer=, mock_text_file=) or flags.\n";
}

void write_output_file(const std::filesystem::path& input, const std::string& text) {
  const std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  const std::filesystem::path out_file = out_dir / (input.stem().string() + ".json");
  std::ofstream f(out_file);
  if (f) {
    f << text << "\n";
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> inputs;
  std::string recognizer_override;
  std::string text_file_override;
  std::string strategy_override;
  std::string save_processed_path;
  bool validate = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--recognizer" && i + 1 < argc) {
      recognizer_override = argv[++i];
    } else if (arg == "--text-file" && i + 1 < argc) {
      text_file_override = argv[++i];
    } else if (arg == "--strategy" && i + 1 < argc) {
      strategy_override = argv[++i];
    } else if (arg == "--save-processed" && i + 1 < argc) {
      save_processed_path = argv[++i];
    } else if (arg == "--validate") {
      validate = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  deductly::app::ScannerConfig cfg = deductly::app::default_config();
  if (!config_path.empty()) {
    auto loaded = deductly::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Failed to load config: " << config_path << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }

  if (!recognizer_override.empty()) {
    auto type = deductly::app::parse_recognizer_type(recognizer_override);
    if (!type) {
      std::cerr << "Unknown --recognizer " << recognizer_override << " (use mock or tesseract)\n";
      return 1;
    }
    cfg.recognizer = *type;
  }
  if (!text_file_override.empty()) {
    cfg.mock_text_file = text_file_override;
  }
  if (!strategy_override.empty()) {
    auto kind = deductly::analysis::parse_strategy_kind(strategy_override);
    if (!kind) {
      std::cerr << "Unknown --strategy " << strategy_override << " (use heuristic or presence)\n";
      return 1;
    }
    cfg.confidence_strategy = *kind;
  }
  if (!deductly::core::log::set_level(cfg.log_level)) {
    std::cerr << "Unknown log_level " << cfg.log_level << "; keeping default\n";
  }

  if (inputs.empty()) {
    print_usage();
    return 1;
  }

  std::unique_ptr<deductly::app::ReceiptScanner> scanner;
  try {
    scanner = deductly::app::make_scanner(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Failed to create scanner: " << e.what() << "\n";
    return 1;
  }

  if (!save_processed_path.empty()) {
    auto processed = scanner->preprocess(deductly::core::ReceiptImage::from_path(inputs.front()));
    if (!processed) {
      std::cerr << "Preprocessing failed: " << deductly::core::to_string(processed.error()) << "\n";
    } else if (!deductly::vision::save_bitmap(processed->bitmap, save_processed_path)) {
      std::cerr << "Warning: could not write " << save_processed_path << "\n";
    }
  }

  int exit_code = 0;
  for (const auto& input : inputs) {
    const auto result = scanner->scan(std::filesystem::path(input));

    nlohmann::json j = result;
    if (validate && result.record) {
      j["validation_errors"] = deductly::app::ReceiptScanner::validate(*result.record);
    }
    const std::string text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    std::cout << text << "\n";
    write_output_file(input, text);

    if (!result.success) exit_code = 1;
  }
  return exit_code;
}
