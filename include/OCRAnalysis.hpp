#ifndef OCR_ANALYSIS_HPP
#define OCR_ANALYSIS_HPP

#include "TextToken.hpp"

#include <opencv2/opencv.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace facesheet {

/**
 * @brief Result of OCR on one page: the token stream and metadata
 */
struct OCRResult {
  std::vector<TextToken> tokens; ///< Word tokens in engine order
  double processingTimeMs = 0;   ///< Processing time in milliseconds
  bool success = false;          ///< Whether OCR was successful
  std::string errorMessage;      ///< Error message if failed
};

/**
 * @brief Configuration options for OCR processing
 */
struct OCRConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu", "fra")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO;      ///< Page segmentation mode
  bool preprocessImage = false; ///< Apply preprocessing (grayscale, threshold)
  float minConfidence = 0;      ///< Drop tokens below this at the source
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX or default)
};

/**
 * @brief Tesseract-backed token source for facesheet pages
 *
 * Recognizes an image and returns its words as TextToken records. The engine
 * data path is part of the configuration; nothing is set process-wide.
 *
 * Example usage:
 * @code
 * facesheet::OCRConfig config;
 * config.tessDataPath = "/usr/share/tesseract-ocr/5/tessdata";
 * facesheet::OCRAnalysis analyzer(config);
 * if (analyzer.initialize()) {
 *     auto result = analyzer.analyzeImage("facesheet.jpg");
 *     if (result.success) {
 *         auto fields = facesheet::extractFields(result.tokens, specs);
 *     }
 * }
 * @endcode
 */
class OCRAnalysis {
public:
  /**
   * @brief Default constructor
   */
  OCRAnalysis();

  /**
   * @brief Constructor with custom configuration
   * @param config OCR configuration options
   */
  explicit OCRAnalysis(const OCRConfig &config);

  /**
   * @brief Destructor
   */
  ~OCRAnalysis();

  // Disable copy operations (Tesseract API is not copyable)
  OCRAnalysis(const OCRAnalysis &) = delete;
  OCRAnalysis &operator=(const OCRAnalysis &) = delete;

  // Enable move operations
  OCRAnalysis(OCRAnalysis &&other) noexcept;
  OCRAnalysis &operator=(OCRAnalysis &&other) noexcept;

  /**
   * @brief Initialize the OCR engine
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  /**
   * @brief Check if the OCR engine is initialized
   * @return true if initialized, false otherwise
   */
  bool isInitialized() const;

  /**
   * @brief Load an image file and recognize its tokens
   * @param imagePath Path to the image file
   * @return OCRResult containing the tokens
   */
  OCRResult analyzeImage(const std::string &imagePath);

  /**
   * @brief Recognize the tokens of an OpenCV image
   * @param image OpenCV Mat image (BGR, BGRA or grayscale)
   * @return OCRResult containing the tokens
   */
  OCRResult analyzeImage(const cv::Mat &image);

  /**
   * @brief Recognize an image and return the raw parallel-array table
   *
   * This is the engine's word-level data before it is turned into tokens,
   * for tools that index by column name.
   *
   * @param image OpenCV Mat image
   * @return TokenTable; empty if the engine is not initialized
   */
  TokenTable recognizeTable(const cv::Mat &image);

  /**
   * @brief Get the current configuration
   * @return Current OCR configuration
   */
  const OCRConfig &getConfig() const;

  /**
   * @brief Get the Tesseract version string
   * @return Tesseract version
   */
  static std::string getTesseractVersion();

  /**
   * @brief Get available languages
   * @return Vector of available language codes
   */
  std::vector<std::string> getAvailableLanguages() const;

private:
  /**
   * @brief Preprocess image for better OCR results
   * @param image Input image
   * @return Preprocessed image
   */
  cv::Mat preprocessImage(const cv::Mat &image);

  /**
   * @brief Convert OpenCV Mat to Tesseract-compatible format
   * @param image OpenCV Mat image
   */
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;    ///< Tesseract API instance
  OCRConfig m_config; ///< Current configuration
  bool m_initialized; ///< Initialization state
};

/**
 * @brief Read tokens from a saved Tesseract TSV file
 *
 * Lets pages that were already OCRed (e.g. `tesseract page.jpg page tsv`) go
 * through field extraction without running the engine again.
 *
 * @param tsvPath Path to the .tsv file
 * @return OCRResult containing the tokens
 */
OCRResult loadTokensFromTSV(const std::string &tsvPath);

} // namespace facesheet

#endif // OCR_ANALYSIS_HPP
