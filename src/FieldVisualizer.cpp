#include "FieldVisualizer.hpp"

#include <algorithm>

namespace facesheet {

void FieldVisualizer::drawBox(cv::Mat &image, const cv::Rect &box,
                              const cv::Scalar &color, int thickness) {
  cv::rectangle(image, box, color, thickness);
}

void FieldVisualizer::drawTokens(cv::Mat &image,
                                 const std::vector<TextToken> &tokens,
                                 const cv::Scalar &color) {
  for (const auto &token : tokens) {
    drawBox(image, token.boundingBox, color);
  }
}

void FieldVisualizer::drawExtraction(
    cv::Mat &image, const std::vector<TextToken> &tokens,
    const std::vector<FieldSpec> &specs,
    const std::vector<ExtractedField> &fields) {
  const cv::Scalar labelColor(255, 0, 0);  // Blue (BGR)
  const cv::Scalar bandColor(0, 255, 255); // Yellow (BGR)
  const cv::Scalar textColor(0, 128, 0);   // Dark green (BGR)

  size_t count = std::min(specs.size(), fields.size());
  for (size_t i = 0; i < count; ++i) {
    const TextToken *labelToken = locateLabel(specs[i].label, tokens);
    if (labelToken == nullptr) {
      continue;
    }

    const cv::Rect &labelBox = labelToken->boundingBox;

    // Region where value tokens may start; no wider than the image so the
    // right edge cannot overflow
    int bandWidth =
        std::max(1, std::min(specs[i].maxHorizontalDistance, image.cols));
    cv::Rect band(labelBox.x, labelBox.y - kSameLineTolerance, bandWidth,
                  labelBox.height + 2 * kSameLineTolerance);
    band &= cv::Rect(0, 0, image.cols, image.rows);
    if (!band.empty()) {
      drawBox(image, band, bandColor, 1);
    }
    drawBox(image, labelBox, labelColor, 2);

    if (!fields[i].value.empty()) {
      int textY = std::max(12, labelBox.y - kSameLineTolerance - 4);
      cv::putText(image, fields[i].value, cv::Point(labelBox.x, textY),
                  cv::FONT_HERSHEY_SIMPLEX, 0.5, textColor, 1);
    }
  }
}

cv::Mat FieldVisualizer::resizeToWidth(const cv::Mat &image, int width,
                                       int interpolation) {
  if (width <= 0 || image.empty()) {
    return image;
  }

  double ratio = width / static_cast<double>(image.cols);
  cv::Mat resized;
  cv::resize(image, resized,
             cv::Size(width, static_cast<int>(image.rows * ratio)), 0, 0,
             interpolation);
  return resized;
}

cv::Mat FieldVisualizer::resizeToHeight(const cv::Mat &image, int height,
                                        int interpolation) {
  if (height <= 0 || image.empty()) {
    return image;
  }

  double ratio = height / static_cast<double>(image.rows);
  cv::Mat resized;
  cv::resize(image, resized,
             cv::Size(static_cast<int>(image.cols * ratio), height), 0, 0,
             interpolation);
  return resized;
}

void FieldVisualizer::showImage(const cv::Mat &image,
                                const std::string &windowName) {
  cv::imshow(windowName, image);
  cv::waitKey(0);
  cv::destroyAllWindows();
}

} // namespace facesheet
