#ifndef TEXT_TOKEN_HPP
#define TEXT_TOKEN_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace facesheet {

/**
 * @brief One recognized text span with its bounding box and confidence
 *
 * Tokens are produced once at the OCR boundary and never modified afterwards.
 */
struct TextToken {
  std::string text;     ///< Recognized text content
  cv::Rect boundingBox; ///< Bounding rectangle (origin top-left, pixels)
  float confidence = 0.0f; ///< Confidence score (0-100)
};

/**
 * @brief Dictionary-of-parallel-arrays token representation
 *
 * Mirrors the column layout of Tesseract's TSV output. Index i of every array
 * describes the same token. Only used at the boundary with the OCR engine and
 * external tools; the extraction code works on TextToken.
 */
struct TokenTable {
  std::vector<int> level;  ///< Tesseract page iterator level (5 = word)
  std::vector<int> left;   ///< X of the top-left corner
  std::vector<int> top;    ///< Y of the top-left corner
  std::vector<int> width;  ///< Box width
  std::vector<int> height; ///< Box height
  std::vector<float> conf; ///< Confidence, -1 for structural rows
  std::vector<std::string> text; ///< Recognized text

  /**
   * @brief Number of entries (length of the text column)
   */
  size_t size() const { return text.size(); }

  /**
   * @brief Check that every column has the same length
   *
   * The level column may be empty when the producer does not supply it.
   */
  bool isConsistent() const;
};

/**
 * @brief Result of converting a TokenTable into tokens
 */
struct TokenConversionResult {
  bool success = false;           ///< Whether the table was well formed
  std::string errorMessage;       ///< Error message if failed
  std::vector<TextToken> tokens;  ///< Converted tokens, table order preserved
};

/**
 * @brief Build tokens from a parallel-array table
 *
 * Entries with empty or whitespace-only text and Tesseract structural rows
 * (confidence below zero) are dropped. Fails when the columns have different
 * lengths.
 *
 * @param table Table produced by the OCR engine or read from a TSV dump
 * @return TokenConversionResult containing the tokens
 */
TokenConversionResult tokensFromTable(const TokenTable &table);

/**
 * @brief Convert tokens back into the parallel-array layout
 * @param tokens Tokens to convert
 * @return Table with level set to the word level for every entry
 */
TokenTable tableFromTokens(const std::vector<TextToken> &tokens);

/**
 * @brief Parse Tesseract TSV output into a TokenTable
 *
 * Expects the 12-column layout written by TessBaseAPI::GetTSVText() and the
 * `tesseract ... tsv` command (level, page_num, block_num, par_num, line_num,
 * word_num, left, top, width, height, conf, text). A header row is skipped
 * if present. Malformed rows are skipped.
 *
 * @param tsv TSV text
 * @return Parsed table
 */
TokenTable parseTesseractTSV(const std::string &tsv);

} // namespace facesheet

#endif // TEXT_TOKEN_HPP
