#include <clashvision/app/config.hpp>
#include <clashvision/app/detection_session.hpp>
#include <clashvision/core/box.hpp>
#include <clashvision/core/error.hpp>
#include <clashvision/vision/exporter.hpp>
#include <clashvision/vision/letterbox.hpp>
#include <clashvision/vision/mock_inference_backend.hpp>
#include <clashvision/vision/nms.hpp>
#include <clashvision/vision/normalize.hpp>
#include <clashvision/vision/output_decoder.hpp>
#include <clashvision/vision/renderer.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace clashvision::core;
using namespace clashvision::vision;
using namespace clashvision::app;
namespace fs = std::filesystem;

// 640x360 screenshot, letterboxed to 320x320: scale 0.5, pad_top 70.
constexpr int kSourceWidth = 640;
constexpr int kSourceHeight = 360;

class FullPipeline : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("clashvision_full_pipeline_" +
            std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    image_ = dir_ / "village.png";
    cv::Mat bgr(kSourceHeight, kSourceWidth, CV_8UC3, cv::Scalar(30, 120, 60));
    ASSERT_TRUE(cv::imwrite(image_.string(), bgr));

    config_ = default_config();
    config_.input_width = 320;
    config_.input_height = 320;
    config_.output_dir = (dir_ / "output").string();
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
  fs::path image_;
  SessionConfig config_;
};

// Top-k rows in model input space: (x1, y1, x2, y2, confidence, class).
RawTensor topk_tensor() {
  return RawTensor{"output0",
                   {1, 4, 6},
                   {
                       100.f, 100.f, 140.f, 140.f, 0.90f, 0.f,  // elixir
                       102.f, 102.f, 142.f, 142.f, 0.85f, 1.f,  // gold, overlaps elixir
                       104.f, 104.f, 144.f, 144.f, 0.60f, 0.f,  // elixir duplicate
                       200.f, 180.f, 240.f, 220.f, 0.20f, 1.f,  // below threshold
                   }};
}

}  // namespace

TEST_F(FullPipeline, TopkPerClassToJson) {
  config_.model_variant = "yolov10";
  config_.per_class_nms = true;
  config_.output_format = ExportFormat::Json;
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_output(topk_tensor());
  DetectionSession session(std::move(mock), config_);

  auto report = session.process_image(image_.string());
  ASSERT_TRUE(report.has_value()) << error_name(report.error());
  EXPECT_EQ(session.last_state(), SessionState::Saved);

  // Duplicate elixir suppressed; gold survives because suppression is per class.
  ASSERT_EQ(report->detections.size(), 2u);
  EXPECT_EQ(report->detections[0].class_id, 0);
  EXPECT_EQ(report->detections[1].class_id, 1);
  EXPECT_FLOAT_EQ(report->detections[0].x1, 200.f);
  EXPECT_FLOAT_EQ(report->detections[0].y1, 60.f);
  EXPECT_FLOAT_EQ(report->detections[0].x2, 280.f);
  EXPECT_FLOAT_EQ(report->detections[0].y2, 140.f);
  EXPECT_EQ(report->stats.classes_detected.size(), 2u);

  EXPECT_TRUE(fs::exists(dir_ / "output" / "village.jpg"));
  std::ifstream in(dir_ / "output" / "village.json");
  std::stringstream json;
  json << in.rdbuf();
  EXPECT_NE(json.str().find("Gold Storage"), std::string::npos);
  EXPECT_NE(json.str().find("Elixir Storage"), std::string::npos);
}

TEST_F(FullPipeline, AgnosticSuppressionKeepsStrongestOnly) {
  config_.model_variant = "yolov10";
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_output(topk_tensor());
  DetectionSession session(std::move(mock), config_);

  auto report = session.process_image(image_.string());
  ASSERT_TRUE(report.has_value());
  ASSERT_EQ(report->detections.size(), 1u);
  EXPECT_FLOAT_EQ(report->detections[0].confidence, 0.90f);
}

TEST_F(FullPipeline, StagesComposeLikeTheSession) {
  // Run the stages by hand and compare with the session's record.
  config_.model_variant = "yolov10";
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_output(topk_tensor());
  DetectionSession session(std::move(mock), config_);
  auto report = session.process_image(image_.string());
  ASSERT_TRUE(report.has_value());

  auto letterboxed = preprocess(image_.string(), {320, 320});
  ASSERT_TRUE(letterboxed.has_value());
  auto input = normalize(letterboxed->planar);
  ASSERT_TRUE(input.has_value());
  EXPECT_EQ(input->size(), (ImageSize{320, 320}));

  auto decoded = decode_topk(topk_tensor(), config_.confidence_threshold);
  ASSERT_TRUE(decoded.has_value());
  SuppressionOptions options;
  options.iou_threshold = config_.iou_threshold;
  options.confidence_floor = config_.confidence_threshold;
  const DetectionSet kept = suppress(*decoded, options);
  const DetectionSet mapped = unletterbox(kept, letterboxed->info);
  auto text = export_detections(mapped, {kSourceWidth, kSourceHeight},
                                ExportFormat::NormalizedText);
  ASSERT_TRUE(text.has_value());

  std::ifstream in(report->record_output);
  std::stringstream record;
  record << in.rdbuf();
  EXPECT_EQ(record.str(), *text);
}

TEST_F(FullPipeline, BatchReportsPerImage) {
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_output(RawTensor{"output0", {1, 6, 1}, {160.f, 160.f, 32.f, 32.f, 0.7f, 0.2f}});
  DetectionSession session(std::move(mock), config_);

  const fs::path corrupt = dir_ / "corrupt.png";
  std::ofstream(corrupt) << "not an image";

  const auto results =
      session.process_images_batch({image_.string(), corrupt.string(), image_.string()});
  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].has_value());
  ASSERT_FALSE(results[1].has_value());
  EXPECT_EQ(results[1].error(), PipelineError::ImageLoadFailed);
  EXPECT_TRUE(results[2].has_value());
  EXPECT_FALSE(fs::exists(dir_ / "output" / "corrupt.jpg"));
  EXPECT_FALSE(fs::exists(dir_ / "output" / "corrupt.txt"));
}

TEST_F(FullPipeline, RealModelWhenAvailable) {
  const char* env = std::getenv("CLASHVISION_TEST_ONNX_MODEL");
  if (!env || env[0] == '\0' || !fs::exists(env)) {
    GTEST_SKIP() << "Set CLASHVISION_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  config_.model_path = env;
  auto session = make_onnx_session(config_);
  auto report = session->process_image(image_.string());
  ASSERT_TRUE(report.has_value()) << error_name(report.error());
  EXPECT_TRUE(fs::exists(report->image_output));
  EXPECT_TRUE(fs::exists(report->record_output));
  for (const auto& b : report->detections) {
    EXPECT_GE(b.confidence, config_.confidence_threshold);
    EXPECT_LE(b.x2, static_cast<float>(kSourceWidth));
    EXPECT_LE(b.y2, static_cast<float>(kSourceHeight));
  }
}
