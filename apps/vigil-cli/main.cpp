/**
 * vigil-cli: run object detection on image file(s) and print detections.
 * Run: ./build/apps/vigil-cli/vigil_cli [--config path] --input image [--input image ...]
 * Each input's results are also written to output/<basename>.txt (same content as terminal).
 */

#include <vigil/app/batch_runner.hpp>
#include <vigil/app/config.hpp>
#include <vigil/app/detector_factory.hpp>
#include <vigil/core/detection.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/vision/load_image.hpp>
#include <vigil/vision/object_detector.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string format_detections(const std::vector<vigil::core::DetectionResult>& detections) {
  std::ostringstream out;
  out << "detections=" << detections.size() << "\n";
  for (const auto& d : detections) {
    out << "  " << d.label << " confidence=" << d.confidence << " bbox=(" << d.bounding_box.x
        << "," << d.bounding_box.y << "," << d.bounding_box.width << ","
        << d.bounding_box.height << ")\n";
  }
  return out.str();
}

void write_output_file(const std::string& input_path, const std::string& text) {
  std::filesystem::path p(input_path);
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

void print_usage() {
  std::cout << "Usage: vigil_cli [options] --input <path> [--input <path> ...]\n"
            << "  --config <path>     Model config (key=value file); default: built-in Tiny YOLOv3\n"
            << "  --backend <type>    Override backend: onnx | mock (default from config)\n"
            << "  --model <path>      Override model path\n"
            << "  --labels <path>     Override labels file\n"
            << "  --workers <n>       Batch workers for several inputs (0 = all cores)\n"
            << "  --log-level <lvl>   trace | debug | info | warn | error | off\n"
            << "  --input <path>      Image path; repeat for a batch run with summary\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> inputs;
  std::string backend_override;
  std::string model_override;
  std::string labels_override;
  std::string workers_override;
  std::string log_level_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--labels" && i + 1 < argc) {
      labels_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown or incomplete argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  if (inputs.empty()) {
    std::cerr << "At least one --input is required\n";
    print_usage();
    return 1;
  }

  std::unique_ptr<vigil::vision::ObjectDetector> detector;
  vigil::app::AppConfig cfg;
  try {
    cfg = config_path.empty() ? vigil::app::default_config()
                              : vigil::app::load_config(config_path);

    if (!backend_override.empty()) {
      if (backend_override == "mock") {
        cfg.backend_type = vigil::app::InferenceBackendType::Mock;
      } else if (backend_override == "onnx") {
        cfg.backend_type = vigil::app::InferenceBackendType::Onnx;
      } else {
        std::cerr << "Unknown --backend " << backend_override << " (use onnx or mock)\n";
        return 1;
      }
    }
    if (!model_override.empty()) cfg.model.model_path = model_override;
    if (!labels_override.empty()) cfg.model.labels_path = labels_override;
    if (!log_level_override.empty()) cfg.log_level = log_level_override;
    if (!workers_override.empty()) {
      try {
        cfg.batch_workers = static_cast<std::size_t>(std::stoul(workers_override));
      } catch (const std::logic_error&) {
        std::cerr << "Invalid --workers " << workers_override << "\n";
        return 1;
      }
    }

    vigil::core::set_log_level(cfg.log_level);
    detector = vigil::app::make_object_detector(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Startup failed: " << e.what() << "\n";
    return 1;
  }

  if (inputs.size() == 1) {
    auto image = vigil::vision::load_image(inputs.front());
    if (!image) {
      std::cerr << "Failed to load image: " << inputs.front() << "\n";
      return 1;
    }
    auto result = detector->detect(*image);
    if (!result) {
      std::cerr << "Detection error: " << vigil::core::to_string(result.error()) << "\n";
      return 1;
    }
    const std::string text = format_detections(*result);
    std::cout << text;
    write_output_file(inputs.front(), text);
    return 0;
  }

  vigil::app::BatchOptions options;
  options.num_workers = cfg.batch_workers;
  options.progress = [](std::size_t processed, std::size_t total) {
    std::cerr << "processed " << processed << "/" << total << "\n";
  };
  auto batch = vigil::app::run_detection_batch(*detector, inputs, options);
  if (!batch) {
    std::cerr << "Detection error in " << inputs[batch.error().frame_index] << ": "
              << vigil::core::to_string(batch.error().error) << "\n";
    return 1;
  }

  for (const auto& frame : batch->frames) {
    const std::string& path = inputs[frame.frame_index];
    const std::string text = format_detections(frame.detections);
    std::cout << path << " " << text;
    write_output_file(path, text);
  }
  std::cout << "summary:\n";
  for (const auto& s : batch->objects) {
    std::cout << "  " << s.label << " count=" << s.count
              << " average_confidence=" << s.average_confidence << "\n";
  }
  return 0;
}
