#include <vigil/core/error.hpp>
#include <vigil/core/image.hpp>
#include <vigil/core/model_config.hpp>
#include <vigil/core/tensor.hpp>
#include <vigil/vision/labels.hpp>
#include <vigil/vision/mock_inference_backend.hpp>
#include <vigil/vision/object_detector.hpp>
#include <vigil/vision/tiny_yolov3_model.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

namespace vv = vigil::vision;
namespace vc = vigil::core;

namespace {

/// Two overlapping "cat" boxes and one "dog" box in (y1, x1, y2, x2).
vc::NamedTensors three_box_outputs() {
  vc::NamedTensors out;
  out.emplace("yolonms_layer_1",
              vc::Tensor(std::vector<std::int64_t>{1, 3, 4},
                         std::vector<float>{0, 0, 100, 100, 5, 5, 105, 105, 0, 0, 100, 100}));
  // scores [1, C=2, N=3]
  out.emplace("yolonms_layer_1:1",
              vc::Tensor(std::vector<std::int64_t>{1, 2, 3},
                         std::vector<float>{0.9f, 0.7f, 0.0f, 0.0f, 0.0f, 0.8f}));
  return out;
}

struct Fixture {
  vv::MockInferenceBackend* mock{nullptr};
  std::unique_ptr<vv::ObjectDetector> detector;
};

Fixture make_detector() {
  auto backend = std::make_unique<vv::MockInferenceBackend>();
  backend->set_outputs(three_box_outputs());
  Fixture f;
  f.mock = backend.get();
  auto config = std::make_shared<const vc::ModelConfig>(vc::tiny_yolov3_defaults());
  auto labels = std::make_shared<const vv::LabelList>(vv::LabelList{"cat", "dog"});
  auto model = std::make_unique<vv::TinyYoloV3Model>(config, labels, std::move(backend));
  f.detector = std::make_unique<vv::ObjectDetector>(std::move(model), config->iou_threshold);
  return f;
}

vc::Image rgb_image(std::uint32_t w, std::uint32_t h) {
  return vc::Image(w, h, vc::PixelFormat::RGB8,
                   std::vector<std::byte>(vc::Image::min_bytes(w, h, vc::PixelFormat::RGB8)));
}

}  // namespace

TEST(ObjectDetector, NullModelThrows) {
  EXPECT_THROW({ vv::ObjectDetector detector(nullptr, 0.45f); }, std::invalid_argument);
}

TEST(ObjectDetector, DetectsAndSuppressesPerLabel) {
  auto f = make_detector();
  auto result = f.detector->detect(rgb_image(200, 200));
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->size(), 2u);
  EXPECT_EQ((*result)[0].label, "cat");
  EXPECT_FLOAT_EQ((*result)[0].confidence, 0.9f);
  EXPECT_EQ((*result)[1].label, "dog");
  EXPECT_FLOAT_EQ((*result)[1].confidence, 0.8f);
}

TEST(ObjectDetector, InvalidImageFails) {
  auto f = make_detector();
  auto result = f.detector->detect(vc::Image{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), vc::DetectionError::InvalidImage);
  EXPECT_EQ(f.mock->run_count(), 0u);
}

TEST(ObjectDetector, InferenceFailureFails) {
  auto f = make_detector();
  f.mock->set_fail(true);
  auto result = f.detector->detect(rgb_image(64, 64));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), vc::DetectionError::Inference);
}

TEST(ObjectDetector, UnexpectedOutputShapeFailsWithDecoding) {
  auto f = make_detector();
  vc::NamedTensors bad;
  bad.emplace("yolonms_layer_1", vc::Tensor(std::vector<std::int64_t>{1, 3, 5}));
  bad.emplace("yolonms_layer_1:1", vc::Tensor(std::vector<std::int64_t>{1, 2, 3}));
  f.mock->set_outputs(std::move(bad));
  auto result = f.detector->detect(rgb_image(64, 64));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), vc::DetectionError::Decoding);
}

TEST(ObjectDetector, NoCandidatesIsEmptySuccess) {
  auto f = make_detector();
  vc::NamedTensors none;
  none.emplace("yolonms_layer_1", vc::Tensor(std::vector<std::int64_t>{1, 0, 4}));
  none.emplace("yolonms_layer_1:1", vc::Tensor(std::vector<std::int64_t>{1, 2, 0}));
  f.mock->set_outputs(std::move(none));
  auto result = f.detector->detect(rgb_image(64, 64));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->empty());
}

TEST(ObjectDetector, ReportsEveryStageTiming) {
  auto f = make_detector();
  std::vector<vv::DetectionStage> stages;
  vv::StageTimingCallback cb = [&stages](vv::DetectionStage stage, double ms) {
    EXPECT_GE(ms, 0.0);
    stages.push_back(stage);
  };
  auto result = f.detector->detect(rgb_image(32, 32), &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(stages, (std::vector<vv::DetectionStage>{
                        vv::DetectionStage::Preprocess, vv::DetectionStage::Inference,
                        vv::DetectionStage::Decode, vv::DetectionStage::Suppress}));
}

TEST(ObjectDetector, DetectEncodedDecodesPng) {
  auto f = make_detector();
  cv::Mat img(48, 64, CV_8UC3, cv::Scalar(10, 20, 30));
  std::vector<uchar> png;
  ASSERT_TRUE(cv::imencode(".png", img, png));
  const auto* bytes = reinterpret_cast<const std::byte*>(png.data());
  auto result = f.detector->detect_encoded(std::span<const std::byte>(bytes, png.size()));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->size(), 2u);
  const auto sent = f.mock->last_inputs();
  EXPECT_FLOAT_EQ(sent.at("image_shape").at({0, 0}), 48.f);
  EXPECT_FLOAT_EQ(sent.at("image_shape").at({0, 1}), 64.f);
}

TEST(ObjectDetector, DetectEncodedRejectsGarbage) {
  auto f = make_detector();
  const std::vector<std::byte> garbage(32, std::byte{0x42});
  auto result = f.detector->detect_encoded(garbage);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), vc::DetectionError::InvalidImage);
}
