#include "PageProcessor.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <utility>

namespace facesheet {

PageProcessor::PageProcessor(const std::vector<FieldSpec> &specs,
                             const ExtractionOptions &options,
                             const OCRConfig &ocrConfig)
    : m_specs(specs), m_options(options), m_ocrConfig(ocrConfig) {}

void PageProcessor::setVerbose(bool verbose) { m_verbose = verbose; }

bool PageProcessor::isTSVPage(const std::string &pagePath) {
  std::string extension = std::filesystem::path(pagePath).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return extension == ".tsv";
}

bool PageProcessor::ensureEngine() {
  if (m_engineFailed) {
    return false;
  }

  if (!m_analyzer) {
    m_analyzer = std::make_unique<OCRAnalysis>(m_ocrConfig);
  }

  if (m_analyzer->isInitialized()) {
    return true;
  }

  if (!m_analyzer->initialize()) {
    std::cerr
        << "Failed to initialize OCR engine.\n"
        << "Make sure Tesseract is installed and tessdata is available.\n";
    m_engineFailed = true;
    return false;
  }

  if (m_verbose) {
    const OCRConfig &config = m_analyzer->getConfig();
    std::cerr << "DEBUG: Tesseract " << OCRAnalysis::getTesseractVersion()
              << ", OpenCV " << CV_VERSION << ", language "
              << config.language
              << (config.preprocessImage ? ", preprocessing on" : "")
              << std::endl;

    std::cerr << "DEBUG: Available languages:";
    for (const auto &language : m_analyzer->getAvailableLanguages()) {
      std::cerr << " " << language;
    }
    std::cerr << std::endl;
  }
  return true;
}

PageReport PageProcessor::processPage(const std::string &pagePath) {
  PageReport report;
  report.page = std::filesystem::path(pagePath).filename().string();
  report.success = false;

  OCRResult ocrResult;
  if (isTSVPage(pagePath)) {
    ocrResult = loadTokensFromTSV(pagePath);
  } else if (ensureEngine()) {
    ocrResult = m_analyzer->analyzeImage(pagePath);
  } else {
    ocrResult.errorMessage = "OCR engine not available for " + pagePath;
  }

  if (!ocrResult.success) {
    report.errorMessage = ocrResult.errorMessage;
    return report;
  }

  report.tokens = std::move(ocrResult.tokens);
  report.processingTimeMs = ocrResult.processingTimeMs;
  report.fields = extractFields(report.tokens, m_specs, m_options);
  report.success = true;
  return report;
}

BatchResult
PageProcessor::processPages(const std::vector<std::string> &pagePaths) {
  BatchResult result;
  for (const auto &pagePath : pagePaths) {
    PageReport report = processPage(pagePath);
    if (!report.success) {
      std::cerr << "OCR failed for " << report.page << ": "
                << report.errorMessage << "\n";
      result.failedPages++;
    }
    result.reports.push_back(std::move(report));
  }
  return result;
}

} // namespace facesheet
