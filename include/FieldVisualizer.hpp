#ifndef FIELD_VISUALIZER_HPP
#define FIELD_VISUALIZER_HPP

#include "FieldExtraction.hpp"

#include <opencv2/opencv.hpp>

#include <string>
#include <vector>

namespace facesheet {

/**
 * @brief Debug overlay for token boxes and extracted fields
 *
 * Only called by front ends; the extraction functions never draw.
 */
class FieldVisualizer {
public:
  /**
   * @brief Draw an unfilled box on an image
   * @param image Image to draw on
   * @param box Box to draw
   * @param color BGR border color (default red)
   * @param thickness Border thickness in pixels
   */
  static void drawBox(cv::Mat &image, const cv::Rect &box,
                      const cv::Scalar &color = cv::Scalar(0, 0, 255),
                      int thickness = 2);

  /**
   * @brief Draw the box of every token
   */
  static void drawTokens(cv::Mat &image, const std::vector<TextToken> &tokens,
                         const cv::Scalar &color = cv::Scalar(0, 0, 255));

  /**
   * @brief Mark labels, search bands and values of extracted fields
   *
   * For each spec whose label is on the page, the label is outlined in blue,
   * the band searched for its value in yellow, and the value is written above
   * the band. specs and fields must come from the same extractFields() call.
   *
   * @param image Image to draw on (same coordinates as the tokens)
   * @param tokens Tokens the fields were extracted from
   * @param specs Field specifications
   * @param fields Extraction results in spec order
   */
  static void drawExtraction(cv::Mat &image,
                             const std::vector<TextToken> &tokens,
                             const std::vector<FieldSpec> &specs,
                             const std::vector<ExtractedField> &fields);

  /**
   * @brief Resize to a target width, keeping the aspect ratio
   * @return Resized image, or the input if width is not positive
   */
  static cv::Mat resizeToWidth(const cv::Mat &image, int width,
                               int interpolation = cv::INTER_AREA);

  /**
   * @brief Resize to a target height, keeping the aspect ratio
   * @return Resized image, or the input if height is not positive
   */
  static cv::Mat resizeToHeight(const cv::Mat &image, int height,
                                int interpolation = cv::INTER_AREA);

  /**
   * @brief Show an image in a named window and wait for a key press
   */
  static void showImage(const cv::Mat &image,
                        const std::string &windowName = "untitled");
};

} // namespace facesheet

#endif // FIELD_VISUALIZER_HPP
