#ifndef FIELD_EXTRACTION_HPP
#define FIELD_EXTRACTION_HPP

#include "NameParser.hpp"
#include "TextToken.hpp"

#include <string>
#include <vector>

namespace facesheet {

/// Maximum |dy| (exclusive) between a label and a token on the same line
const int kSameLineTolerance = 10;

/// Default confidence floor for value candidates
const float kDefaultMinConfidence = 10.0f;

/**
 * @brief How a field's value is post-processed
 */
enum class FieldType {
  Plain, ///< Value is reported as assembled
  Name   ///< Value is additionally split into first/middle/last
};

/**
 * @brief How the label token is kept out of its own value
 */
enum class SelfExclusion {
  ByIdentity, ///< Exclude only the located label token itself
  ByText      ///< Exclude every token whose text equals the label's text
};

/**
 * @brief One configured field to extract
 */
struct FieldSpec {
  std::string label;             ///< Label prefix as printed on the page
  int maxHorizontalDistance = 0; ///< Exclusive bound on value x - label x
  FieldType type = FieldType::Plain; ///< Post-processing of the value
};

/**
 * @brief Extraction result for one field
 */
struct ExtractedField {
  std::string label;       ///< Configured label
  std::string value;       ///< Assembled value, empty when nothing matched
  bool labelFound = false; ///< Whether the label was located on the page
  bool hasParsedName = false; ///< Whether parsedName is set (Name fields)
  ParsedName parsedName;      ///< Name components for Name fields
};

/**
 * @brief Options shared by every field of an extraction run
 */
struct ExtractionOptions {
  float minConfidence = kDefaultMinConfidence; ///< Candidate confidence floor
  SelfExclusion selfExclusion = SelfExclusion::ByIdentity;
};

/**
 * @brief Find the label token for a field
 *
 * Scans the tokens in the order given and returns the first one whose text
 * starts with the label, ignoring ASCII case. Confidence is not considered.
 *
 * @param label Label prefix to look for
 * @param tokens Tokens of one page
 * @return Pointer into tokens, or nullptr if the label is not on the page
 */
const TextToken *locateLabel(const std::string &label,
                             const std::vector<TextToken> &tokens);

/**
 * @brief Check whether a token may be part of a label's value
 *
 * A candidate has enough confidence, is not the label (see SelfExclusion),
 * contains no colon, lies on the label's line and starts to the right of the
 * label within maxHorizontalDistance.
 */
bool isValueCandidate(const TextToken &labelToken, const TextToken &token,
                      int maxHorizontalDistance, float minConfidence,
                      SelfExclusion exclusion);

/**
 * @brief Assemble the value for a located label
 *
 * Collects the candidate tokens (see isValueCandidate), orders them left to
 * right and joins their text with single spaces.
 *
 * @param labelToken Label token returned by locateLabel
 * @param tokens Tokens of the same page
 * @param maxHorizontalDistance Exclusive bound on token x - label x
 * @param minConfidence Candidate confidence floor
 * @param exclusion How the label token is excluded
 * @return Value text, empty if no token qualifies
 */
std::string
associateValue(const TextToken &labelToken,
               const std::vector<TextToken> &tokens, int maxHorizontalDistance,
               float minConfidence = kDefaultMinConfidence,
               SelfExclusion exclusion = SelfExclusion::ByIdentity);

/**
 * @brief Extract every configured field from one page
 *
 * Fields are independent: a token may contribute to several fields. The
 * output has one entry per spec, in spec order. A label missing from the page
 * produces an entry with an empty value and labelFound = false.
 *
 * @param tokens Tokens of one page
 * @param specs Fields to extract
 * @param options Confidence floor and self-exclusion mode
 * @return Extracted fields in spec order
 */
std::vector<ExtractedField>
extractFields(const std::vector<TextToken> &tokens,
              const std::vector<FieldSpec> &specs,
              const ExtractionOptions &options = ExtractionOptions());

} // namespace facesheet

#endif // FIELD_EXTRACTION_HPP
