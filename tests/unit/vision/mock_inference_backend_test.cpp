#include <vigil/core/error.hpp>
#include <vigil/core/tensor.hpp>
#include <vigil/vision/mock_inference_backend.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <vector>

namespace vv = vigil::vision;
namespace vc = vigil::core;

namespace {

vc::NamedTensors two_outputs() {
  vc::NamedTensors out;
  out.emplace("boxes", vc::Tensor(std::vector<std::int64_t>{1, 2, 4}));
  out.emplace("scores", vc::Tensor(std::vector<std::int64_t>{1, 3, 2}));
  return out;
}

}  // namespace

TEST(MockInferenceBackend, ReturnsRequestedOutputs) {
  vv::MockInferenceBackend mock;
  mock.set_outputs(two_outputs());
  const std::vector<std::string> names{"scores"};
  auto result = mock.run({}, names);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->size(), 1u);
  EXPECT_EQ(result->at("scores").shape(), (std::vector<std::int64_t>{1, 3, 2}));
}

TEST(MockInferenceBackend, MissingOutputFailsWithInference) {
  vv::MockInferenceBackend mock;
  mock.set_outputs(two_outputs());
  const std::vector<std::string> names{"boxes", "nope"};
  auto result = mock.run({}, names);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), vc::DetectionError::Inference);
}

TEST(MockInferenceBackend, SetFail) {
  vv::MockInferenceBackend mock;
  mock.set_outputs(two_outputs());
  mock.set_fail(true);
  const std::vector<std::string> names{"boxes"};
  auto result = mock.run({}, names);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), vc::DetectionError::Inference);
  EXPECT_EQ(mock.run_count(), 1u);
}

TEST(MockInferenceBackend, RecordsLastInputs) {
  vv::MockInferenceBackend mock;
  vc::NamedTensors inputs;
  inputs.emplace("input_1", vc::Tensor(std::vector<std::int64_t>{1, 3, 4, 4}));
  (void)mock.run(inputs, {});
  const auto recorded = mock.last_inputs();
  ASSERT_EQ(recorded.count("input_1"), 1u);
  EXPECT_EQ(recorded.at("input_1").size(), 48u);
}

TEST(MockInferenceBackend, DeclaredMetadata) {
  vv::MockInferenceBackend mock;
  mock.set_outputs(two_outputs());
  mock.set_input_names({"input_1", "image_shape"});
  mock.set_output_shape("scores", {-1, 80, -1});

  EXPECT_EQ(mock.input_names(), (std::vector<std::string>{"input_1", "image_shape"}));
  EXPECT_EQ(mock.output_names().size(), 2u);
  EXPECT_EQ(mock.output_shape("scores"), (std::vector<std::int64_t>{-1, 80, -1}));
  EXPECT_EQ(mock.output_shape("boxes"), (std::vector<std::int64_t>{1, 2, 4}));
  EXPECT_FALSE(mock.output_shape("other").has_value());
}
