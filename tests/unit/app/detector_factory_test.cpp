#include <vigil/app/config.hpp>
#include <vigil/app/detector_factory.hpp>
#include <vigil/core/image.hpp>
#include <vigil/core/model_config.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace va = vigil::app;
namespace vc = vigil::core;

namespace {

std::string labels_file() {
  const auto path = std::filesystem::temp_directory_path() / "vigil_factory_labels.txt";
  std::ofstream f(path);
  f << "person\nbicycle\ncar\n";
  return path.string();
}

va::AppConfig mock_config(vc::ModelKind kind) {
  va::AppConfig c = va::default_config();
  c.model = kind == vc::ModelKind::YoloV4 ? vc::yolov4_defaults() : vc::tiny_yolov3_defaults();
  c.model.labels_path = labels_file();
  c.backend_type = va::InferenceBackendType::Mock;
  return c;
}

vc::Image black_image(std::uint32_t w, std::uint32_t h) {
  return vc::Image(w, h, vc::PixelFormat::BGR8,
                   std::vector<std::byte>(vc::Image::min_bytes(w, h, vc::PixelFormat::BGR8)));
}

}  // namespace

TEST(DetectorFactory, MockTinyYoloV3Detects) {
  auto detector = va::make_object_detector(mock_config(vc::ModelKind::TinyYoloV3));
  ASSERT_NE(detector, nullptr);
  EXPECT_EQ(detector->model().name(), "tiny_yolov3");
  auto result = detector->detect(black_image(200, 150));
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->size(), 1u);
  EXPECT_EQ(result->front().label, "person");
  EXPECT_FLOAT_EQ(result->front().confidence, 0.9f);
}

TEST(DetectorFactory, MockYoloV4Detects) {
  auto detector = va::make_object_detector(mock_config(vc::ModelKind::YoloV4));
  ASSERT_NE(detector, nullptr);
  EXPECT_EQ(detector->model().name(), "yolov4");
  auto result = detector->detect(black_image(416, 416));
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->size(), 1u);
  EXPECT_EQ(result->front().label, "person");
  EXPECT_GT(result->front().bounding_box.width, 0.f);
}

TEST(DetectorFactory, ReportsAllValidationFailures) {
  auto cfg = mock_config(vc::ModelKind::TinyYoloV3);
  cfg.model.image_size = 0;
  cfg.model.iou_threshold = 2.f;
  try {
    (void)va::make_object_detector(cfg);
    FAIL() << "expected ConfigurationError";
  } catch (const va::ConfigurationError& e) {
    const std::string msg = e.what();
    EXPECT_NE(msg.find("image_size"), std::string::npos);
    EXPECT_NE(msg.find("iou_threshold"), std::string::npos);
  }
}

TEST(DetectorFactory, MissingLabelsFileThrows) {
  auto cfg = mock_config(vc::ModelKind::TinyYoloV3);
  cfg.model.labels_path = "/nonexistent/vigil_labels.txt";
  EXPECT_THROW((void)va::make_object_detector(cfg), va::ConfigurationError);
}

TEST(DetectorFactory, OnnxNeedsModelPath) {
  auto cfg = mock_config(vc::ModelKind::TinyYoloV3);
  cfg.backend_type = va::InferenceBackendType::Onnx;
  EXPECT_THROW((void)va::make_object_detector(cfg), va::ConfigurationError);
}

TEST(DetectorFactory, OnnxMissingModelFileThrows) {
  auto cfg = mock_config(vc::ModelKind::TinyYoloV3);
  cfg.backend_type = va::InferenceBackendType::Onnx;
  cfg.model.model_path = "/nonexistent/vigil_model.onnx";
  EXPECT_THROW((void)va::make_object_detector(cfg), va::ConfigurationError);
}

TEST(DetectorFactory, UnknownTensorNameThrows) {
  auto cfg = mock_config(vc::ModelKind::TinyYoloV3);
  auto backend = va::make_inference_backend(cfg, {"person"});
  auto model_cfg = cfg.model;
  model_cfg.output_tensors["boxes"] = "not_an_output";
  EXPECT_THROW((void)va::make_detection_model(
                   std::make_shared<const vc::ModelConfig>(model_cfg),
                   std::make_shared<const vigil::vision::LabelList>(
                       vigil::vision::LabelList{"person"}),
                   std::move(backend)),
               va::ConfigurationError);
}
