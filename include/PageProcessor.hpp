#ifndef PAGE_PROCESSOR_HPP
#define PAGE_PROCESSOR_HPP

#include "FieldExtraction.hpp"
#include "OCRAnalysis.hpp"

#include <memory>
#include <string>
#include <vector>

namespace facesheet {

/**
 * @brief Extraction outcome of one page
 */
struct PageReport {
  std::string page;              ///< File name of the page
  bool success = false;          ///< Whether tokens could be obtained
  std::string errorMessage;      ///< Error message if failed
  std::vector<TextToken> tokens; ///< Tokens the fields were extracted from
  std::vector<ExtractedField> fields; ///< Fields in configuration order
  double processingTimeMs = 0;        ///< Token acquisition time
};

/**
 * @brief Result of processing a list of pages
 */
struct BatchResult {
  std::vector<PageReport> reports; ///< One report per page, in input order
  int failedPages = 0;             ///< Number of reports with success = false
};

/**
 * @brief Turns facesheet pages into extracted fields
 *
 * Pages ending in .tsv are read as saved Tesseract output; any other page is
 * recognized with OCRAnalysis. The OCR engine is only initialized when the
 * first image page is met, so TSV-only batches need no language data. A page
 * that cannot be read produces a failed report and the batch continues.
 */
class PageProcessor {
public:
  /**
   * @param specs Fields to extract from every page
   * @param options Candidate confidence floor and self-exclusion mode
   * @param ocrConfig Engine configuration for image pages
   */
  PageProcessor(const std::vector<FieldSpec> &specs,
                const ExtractionOptions &options, const OCRConfig &ocrConfig);

  /**
   * @brief Print engine details to std::cerr when initializing
   */
  void setVerbose(bool verbose);

  /**
   * @brief Extract the fields of one page
   * @param pagePath Image or .tsv file
   * @return PageReport; success is false if the page could not be read
   */
  PageReport processPage(const std::string &pagePath);

  /**
   * @brief Extract the fields of every page in order
   */
  BatchResult processPages(const std::vector<std::string> &pagePaths);

  /**
   * @brief Whether a path is read as Tesseract TSV instead of an image
   */
  static bool isTSVPage(const std::string &pagePath);

private:
  /**
   * @brief Create and initialize the engine on first use
   * @return true if the engine is ready
   */
  bool ensureEngine();

  std::vector<FieldSpec> m_specs;
  ExtractionOptions m_options;
  OCRConfig m_ocrConfig;
  std::unique_ptr<OCRAnalysis> m_analyzer; ///< Created on the first image
  bool m_engineFailed = false; ///< Initialization failed, do not retry
  bool m_verbose = false;
};

} // namespace facesheet

#endif // PAGE_PROCESSOR_HPP
