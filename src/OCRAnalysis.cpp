#include "OCRAnalysis.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace facesheet {

OCRAnalysis::OCRAnalysis()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

OCRAnalysis::OCRAnalysis(const OCRConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

OCRAnalysis::~OCRAnalysis() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

OCRAnalysis::OCRAnalysis(OCRAnalysis &&other) noexcept
    : m_tesseract(std::move(other.m_tesseract)),
      m_config(std::move(other.m_config)), m_initialized(other.m_initialized) {
  other.m_initialized = false;
}

OCRAnalysis &OCRAnalysis::operator=(OCRAnalysis &&other) noexcept {
  if (this != &other) {
    if (m_tesseract) {
      m_tesseract->End();
    }
    m_tesseract = std::move(other.m_tesseract);
    m_config = std::move(other.m_config);
    m_initialized = other.m_initialized;
    other.m_initialized = false;
  }
  return *this;
}

bool OCRAnalysis::initialize() {
  if (m_initialized) {
    return true;
  }

  if (!m_tesseract) {
    m_tesseract = std::make_unique<tesseract::TessBaseAPI>();
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    } else {
      // Priority 3: Tesseract's compiled-in default
      std::cerr << "TESSDATA_PREFIX not set, using Tesseract default data path"
                << std::endl;
    }
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool OCRAnalysis::isInitialized() const { return m_initialized; }

OCRResult OCRAnalysis::analyzeImage(const std::string &imagePath) {
  OCRResult result;
  result.success = false;

  // Load image using OpenCV
  cv::Mat image = cv::imread(imagePath);
  if (image.empty()) {
    result.errorMessage = "Failed to load image: " + imagePath;
    return result;
  }

  return analyzeImage(image);
}

OCRResult OCRAnalysis::analyzeImage(const cv::Mat &image) {
  OCRResult result;
  result.success = false;

  if (!m_initialized) {
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    TokenTable table = recognizeTable(image);

    TokenConversionResult conversion = tokensFromTable(table);
    if (!conversion.success) {
      result.errorMessage = conversion.errorMessage;
      return result;
    }
    result.tokens = std::move(conversion.tokens);

    // Filter tokens by confidence if configured
    if (m_config.minConfidence > 0) {
      result.tokens.erase(
          std::remove_if(result.tokens.begin(), result.tokens.end(),
                         [this](const TextToken &token) {
                           return token.confidence < m_config.minConfidence;
                         }),
          result.tokens.end());
    }

    result.success = true;
  } catch (const cv::Exception &e) {
    result.errorMessage = std::string("OCR analysis failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

TokenTable OCRAnalysis::recognizeTable(const cv::Mat &image) {
  if (!m_initialized || image.empty()) {
    return TokenTable();
  }

  cv::Mat processedImage =
      m_config.preprocessImage ? preprocessImage(image) : image;

  setImage(processedImage);
  if (m_tesseract->Recognize(nullptr) != 0) {
    std::cerr << "Tesseract recognition failed" << std::endl;
    return TokenTable();
  }

  // Same columns as `tesseract ... tsv`, without the header row
  char *tsv = m_tesseract->GetTSVText(0);
  if (tsv == nullptr) {
    return TokenTable();
  }
  std::string tsvText = tsv;
  delete[] tsv;

  return parseTesseractTSV(tsvText);
}

const OCRConfig &OCRAnalysis::getConfig() const { return m_config; }

std::string OCRAnalysis::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> OCRAnalysis::getAvailableLanguages() const {
  std::vector<std::string> languages;

  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }

  return languages;
}

cv::Mat OCRAnalysis::preprocessImage(const cv::Mat &image) {
  cv::Mat processed;

  // Convert to grayscale if color
  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  // Apply Gaussian blur to reduce noise
  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);

  // Apply adaptive thresholding for better text recognition
  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);

  return processed;
}

void OCRAnalysis::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Convert to RGB if necessary (Tesseract expects RGB)
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

OCRResult loadTokensFromTSV(const std::string &tsvPath) {
  OCRResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  std::ifstream file(tsvPath);
  if (!file) {
    result.errorMessage = "Failed to open TSV file: " + tsvPath;
    return result;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  TokenConversionResult conversion =
      tokensFromTable(parseTesseractTSV(buffer.str()));
  if (!conversion.success) {
    result.errorMessage = conversion.errorMessage;
    return result;
  }

  result.tokens = std::move(conversion.tokens);
  result.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace facesheet
