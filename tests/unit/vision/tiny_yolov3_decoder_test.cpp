#include <vigil/core/error.hpp>
#include <vigil/core/model_config.hpp>
#include <vigil/core/tensor.hpp>
#include <vigil/vision/labels.hpp>
#include <vigil/vision/raw_model_output.hpp>
#include <vigil/vision/tiny_yolov3_decoder.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <memory>
#include <vector>

namespace vv = vigil::vision;
namespace vc = vigil::core;

namespace {

std::shared_ptr<const vc::ModelConfig> config_with(float threshold,
                                                   std::uint32_t display_w = 0,
                                                   std::uint32_t display_h = 0) {
  auto c = vc::tiny_yolov3_defaults();
  c.confidence_threshold = threshold;
  c.display_width = display_w;
  c.display_height = display_h;
  return std::make_shared<const vc::ModelConfig>(c);
}

std::shared_ptr<const vv::LabelList> labels(std::vector<std::string> names) {
  return std::make_shared<const vv::LabelList>(std::move(names));
}

/// One box (y1, x1, y2, x2) with the given per-class scores.
vv::RawModelOutput single_box(std::vector<float> box, std::vector<float> class_scores) {
  const auto classes = static_cast<std::int64_t>(class_scores.size());
  vv::RawModelOutput raw;
  raw.layers.push_back({vc::Tensor(std::vector<std::int64_t>{1, 1, 4}, std::move(box)),
                        vc::Tensor(std::vector<std::int64_t>{1, classes, 1},
                                   std::move(class_scores))});
  return raw;
}

}  // namespace

TEST(TinyYoloV3Decoder, SingleDetectionInOriginalPixels) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f), labels({"cat"}));
  auto out = decoder.decode(single_box({10.f, 20.f, 110.f, 120.f}, {0.9f}), 100, 100);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size(), 1u);
  const auto& d = out->front();
  EXPECT_EQ(d.label, "cat");
  EXPECT_EQ(d.class_id, 0u);
  EXPECT_FLOAT_EQ(d.confidence, 0.9f);
  EXPECT_FLOAT_EQ(d.box.x, 20.f);
  EXPECT_FLOAT_EQ(d.box.y, 10.f);
  EXPECT_FLOAT_EQ(d.box.width, 100.f);
  EXPECT_FLOAT_EQ(d.box.height, 100.f);
}

TEST(TinyYoloV3Decoder, BelowThresholdIsRejected) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f), labels({"cat"}));
  auto out = decoder.decode(single_box({10.f, 20.f, 110.f, 120.f}, {0.1f}), 100, 100);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->empty());
}

TEST(TinyYoloV3Decoder, ScoreEqualToThresholdIsKept) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f), labels({"cat"}));
  auto kept = decoder.decode(single_box({0.f, 0.f, 10.f, 10.f}, {0.25f}), 100, 100);
  ASSERT_TRUE(kept.has_value());
  EXPECT_EQ(kept->size(), 1u);

  const float below = std::nextafter(0.25f, 0.f);
  auto dropped = decoder.decode(single_box({0.f, 0.f, 10.f, 10.f}, {below}), 100, 100);
  ASSERT_TRUE(dropped.has_value());
  EXPECT_TRUE(dropped->empty());
}

TEST(TinyYoloV3Decoder, FirstClassWinsATie) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f), labels({"a", "b", "c"}));
  auto out = decoder.decode(single_box({0.f, 0.f, 10.f, 10.f}, {0.3f, 0.8f, 0.8f}), 50, 50);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size(), 1u);
  EXPECT_EQ(out->front().label, "b");
}

TEST(TinyYoloV3Decoder, ScalesIntoDisplaySpace) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f, 800, 450), labels({"car"}));
  // Original 1600x900 -> factors 0.5, 0.5.
  auto out = decoder.decode(single_box({100.f, 200.f, 300.f, 600.f}, {0.7f}), 1600, 900);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size(), 1u);
  EXPECT_FLOAT_EQ(out->front().box.x, 100.f);
  EXPECT_FLOAT_EQ(out->front().box.y, 50.f);
  EXPECT_FLOAT_EQ(out->front().box.width, 200.f);
  EXPECT_FLOAT_EQ(out->front().box.height, 100.f);
}

TEST(TinyYoloV3Decoder, ScoresIndexedClassThenBox) {
  vv::TinyYoloV3Decoder decoder(config_with(0.5f), labels({"a", "b"}));
  vv::RawModelOutput raw;
  // Two boxes; scores [1, 2, 2]: row c holds class c for box 0, box 1.
  raw.layers.push_back(
      {vc::Tensor(std::vector<std::int64_t>{1, 2, 4},
                  std::vector<float>{0, 0, 10, 10, 20, 20, 30, 30}),
       vc::Tensor(std::vector<std::int64_t>{1, 2, 2}, std::vector<float>{0.9f, 0.1f, 0.2f, 0.6f})});
  auto out = decoder.decode(raw, 100, 100);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size(), 2u);
  EXPECT_EQ((*out)[0].label, "a");
  EXPECT_FLOAT_EQ((*out)[0].confidence, 0.9f);
  EXPECT_EQ((*out)[1].label, "b");
  EXPECT_FLOAT_EQ((*out)[1].confidence, 0.6f);
  EXPECT_FLOAT_EQ((*out)[1].box.x, 20.f);
}

TEST(TinyYoloV3Decoder, ShapeMismatchIsDecodingError) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f), labels({"cat"}));
  vv::RawModelOutput raw;
  raw.layers.push_back({vc::Tensor(std::vector<std::int64_t>{1, 2, 4}),
                        vc::Tensor(std::vector<std::int64_t>{1, 1, 3})});
  auto out = decoder.decode(raw, 100, 100);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), vc::DetectionError::Decoding);
}

TEST(TinyYoloV3Decoder, WrongLayerCountIsDecodingError) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f), labels({"cat"}));
  auto out = decoder.decode(vv::RawModelOutput{}, 100, 100);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), vc::DetectionError::Decoding);
}

TEST(TinyYoloV3Decoder, MoreClassesThanLabelsIsDecodingError) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f), labels({"cat"}));
  auto out = decoder.decode(single_box({0.f, 0.f, 10.f, 10.f}, {0.1f, 0.9f}), 100, 100);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), vc::DetectionError::Decoding);
}

TEST(TinyYoloV3Decoder, EmptyBoxListYieldsNoCandidates) {
  vv::TinyYoloV3Decoder decoder(config_with(0.25f), labels({"cat"}));
  vv::RawModelOutput raw;
  raw.layers.push_back({vc::Tensor(std::vector<std::int64_t>{1, 0, 4}),
                        vc::Tensor(std::vector<std::int64_t>{1, 1, 0})});
  auto out = decoder.decode(raw, 100, 100);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->empty());
}
