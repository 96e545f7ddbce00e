#include "../reading_extractor.hpp"
#include "../track_sanitizer.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <utility>

using namespace dashgpx;

namespace {
// Recognizer that returns canned text keyed by the pixel value of the crop.
class ScriptedRecognizer final : public TextRecognizer {
public:
  explicit ScriptedRecognizer(std::map<int, std::string> script) : script_(std::move(script)) {}

  std::string recognize(const cv::Mat &image) override
  {
    ++calls;
    if (image.empty()) return {};
    auto it = script_.find(image.at<uchar>(0, 0));
    return it == script_.end() ? std::string() : it->second;
  }

  int calls = 0;

private:
  std::map<int, std::string> script_;
};

// Yields one 4x4 crop per second, filled with the frame index.
class CountingSource final : public FrameSource {
public:
  explicit CountingSource(int frames) : frames_(frames) {}

  bool next(SampledFrame &frame) override
  {
    if (second_ >= frames_) return false;
    frame.second = second_;
    frame.overlay = cv::Mat(4, 4, CV_8UC1, cv::Scalar(second_));
    ++second_;
    return true;
  }

  double durationSeconds() const override { return frames_; }

private:
  int frames_;
  int second_ = 0;
};
}

void test_read_frame()
{
  std::cout << "Testing single frame..." << std::endl;
  const auto start = parseStartTime("2024-05-01 08:30:00");
  ScriptedRecognizer recognizer({{7, "43.5N 79.2W"}});
  ReadingExtractor extractor(recognizer, start);

  auto hit = extractor.readFrame(cv::Mat(2, 2, CV_8UC1, cv::Scalar(7)), 42);
  assert(hit.has_value());
  assert(hit->latitude == 43.5);
  assert(hit->longitude == -79.2);
  assert(formatIsoUtc(hit->timestamp) == "2024-05-01T08:30:42Z");

  auto miss = extractor.readFrame(cv::Mat(2, 2, CV_8UC1, cv::Scalar(1)), 43);
  assert(!miss.has_value());
  assert(extractor.stats().sampled_frames == 2);
  assert(extractor.stats().parsed_frames == 1);
}

void test_extract_sparse_video()
{
  std::cout << "Testing extraction over a source..." << std::endl;
  const auto start = parseStartTime("2024-05-01 08:30:00");
  ScriptedRecognizer recognizer({
      {0, "43.0000N 79.0000W"},
      {1, ""},                      // unreadable frame
      {2, "43.0001 79.0001"},       // hemisphere letters dropped
      {3, "44.0000N 79.0000W"},     // misread: 111 km jump
      {4, "garbage ,,"},
      {5, "43.0002N 79.0002W"},
  });
  CountingSource source(6);
  ReadingExtractor extractor(recognizer, start);
  auto readings = extractor.extract(source);

  assert(recognizer.calls == 6);
  assert(readings.size() == 4);
  assert(extractor.stats().sampled_frames == 6);
  assert(extractor.stats().parsed_frames == 4);
  for (size_t i = 1; i < readings.size(); ++i) {
    assert(readings[i - 1].timestamp < readings[i].timestamp);
  }

  // Hand off to the sanitizer the way the application does
  TrackSanitizer sanitizer({+1, -1});
  auto result = sanitizer.sanitize(readings);
  assert(result.corrections == 1);
  assert(result.skipped == 1);
  assert(result.cleaned.size() == 3);
  assert(result.cleaned[1].longitude == -79.0001);
  assert(formatIsoUtc(result.cleaned[2].timestamp) == "2024-05-01T08:30:05Z");
}

int main()
{
  test_read_frame();
  test_extract_sparse_video();
  std::cout << "All extractor tests passed." << std::endl;
  return 0;
}
