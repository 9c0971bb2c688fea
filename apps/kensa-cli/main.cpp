/**
 * kensa-cli: inspect metal-surface image(s) and print a verdict per image.
 * Run:   ./build/apps/kensa-cli/kensa_cli [--config path] --input path [--input path ...]
 * Each input also writes its report to output/<basename>.txt (same content as terminal).
 */

#include <kensa/app/config.hpp>
#include <kensa/app/inspector.hpp>
#include <kensa/app/logging.hpp>
#include <kensa/core/error.hpp>
#include <kensa/core/verdict.hpp>
#include <kensa/vision/image_decoder.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: kensa_cli [options] --input <path> [--input <path> ...]\n"
            << "  --config <path>       Inspection config (key=value file); default: built-in\n"
            << "  --mode <mode>         Override scoring mode: geometric | edge_density | classifier\n"
            << "  --probability <p>     Defect probability for classifier mode (instead of a model)\n"
            << "  --lang <en|ja>        Report language (default: en)\n"
            << "  --log-level <level>   trace | debug | info | warn | error | off (default: warn)\n"
            << "  --input <path>        Image path; repeat for several images\n";
}

std::string format_report(const std::string& input, const kensa::core::Verdict& v,
                          kensa::core::ReportLanguage language) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << input << ": status=" << kensa::core::status_label(v.status, language)
      << " health=" << v.scores.health_score << std::setprecision(4)
      << " defect=" << v.scores.defect_score << " gatekeeper=";
  if (v.scores.gatekeeper_score.has_value()) {
    out << *v.scores.gatekeeper_score;
  } else {
    out << "n/a";
  }
  out << " defects=" << v.scores.defect_count << "\n"
      << "  " << kensa::core::to_string(v.explanation) << ": "
      << kensa::core::explanation_text(v.explanation, language) << "\n";
  return out.str();
}

void write_report(const std::string& input, const std::string& text) {
  std::filesystem::path p(input);
  std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
  std::ofstream f(out_file);
  if (f) {
    f << text;
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string mode_override;
  std::string log_level = "warn";
  std::optional<double> probability;
  kensa::core::ReportLanguage language = kensa::core::ReportLanguage::English;
  std::vector<std::string> inputs;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--mode" && i + 1 < argc) {
      mode_override = argv[++i];
    } else if (arg == "--probability" && i + 1 < argc) {
      try {
        probability = std::stod(argv[++i]);
      } catch (const std::logic_error&) {
        std::cerr << "Invalid --probability " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--lang" && i + 1 < argc) {
      const std::string lang = argv[++i];
      if (lang == "en") {
        language = kensa::core::ReportLanguage::English;
      } else if (lang == "ja") {
        language = kensa::core::ReportLanguage::Japanese;
      } else {
        std::cerr << "Unknown --lang " << lang << " (use en or ja)\n";
        return 1;
      }
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  if (!kensa::app::configure_logging(log_level)) {
    std::cerr << "Unknown --log-level " << log_level << "\n";
    return 1;
  }
  if (inputs.empty()) {
    print_usage();
    return 1;
  }

  kensa::app::InspectionConfig cfg = config_path.empty() ? kensa::app::default_config()
                                                         : kensa::app::load_config(config_path);
  if (!mode_override.empty()) {
    auto mode = kensa::app::parse_scoring_mode(mode_override);
    if (!mode) {
      std::cerr << "Unknown --mode " << mode_override
                << " (use geometric, edge_density, or classifier)\n";
      return 1;
    }
    cfg.scoring_mode = *mode;
  }

  std::optional<kensa::app::Inspector> inspector;
  try {
    inspector.emplace(cfg, kensa::app::make_classifier(cfg.gatekeeper),
                      kensa::app::make_classifier(cfg.defect_classifier));
  } catch (const std::exception& e) {
    std::cerr << "Failed to set up inspector: " << e.what() << "\n";
    return 1;
  }

  int exit_code = 0;
  for (const auto& input : inputs) {
    const auto bytes = kensa::vision::read_file_bytes(input);
    if (bytes.empty()) {
      std::cerr << "Failed to read image: " << input << "\n";
      exit_code = 1;
      continue;
    }
    auto result = inspector->inspect(bytes, probability);
    if (!result) {
      std::cerr << input << ": inspection error: " << kensa::core::to_string(result.error())
                << "\n";
      exit_code = 1;
      continue;
    }
    const std::string text = format_report(input, *result, language);
    std::cout << text;
    write_report(input, text);
  }
  return exit_code;
}
