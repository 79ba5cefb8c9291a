#include "FieldExtraction.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace facesheet {

namespace {

bool startsWithIgnoreCase(const std::string &text, const std::string &prefix) {
  if (prefix.size() > text.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

} // anonymous namespace

const TextToken *locateLabel(const std::string &label,
                             const std::vector<TextToken> &tokens) {
  for (const auto &token : tokens) {
    if (startsWithIgnoreCase(token.text, label)) {
      return &token;
    }
  }
  return nullptr;
}

bool isValueCandidate(const TextToken &labelToken, const TextToken &token,
                      int maxHorizontalDistance, float minConfidence,
                      SelfExclusion exclusion) {
  if (token.confidence < minConfidence) {
    return false;
  }

  if (exclusion == SelfExclusion::ByIdentity) {
    if (&token == &labelToken) {
      return false;
    }
  } else if (token.text == labelToken.text) {
    return false;
  }

  // A colon marks another label
  if (token.text.find(':') != std::string::npos) {
    return false;
  }

  if (std::abs(token.boundingBox.y - labelToken.boundingBox.y) >=
      kSameLineTolerance) {
    return false;
  }

  int dx = token.boundingBox.x - labelToken.boundingBox.x;
  return dx > 0 && dx < maxHorizontalDistance;
}

std::string associateValue(const TextToken &labelToken,
                           const std::vector<TextToken> &tokens,
                           int maxHorizontalDistance, float minConfidence,
                           SelfExclusion exclusion) {
  std::vector<const TextToken *> candidates;
  for (const auto &token : tokens) {
    if (isValueCandidate(labelToken, token, maxHorizontalDistance,
                         minConfidence, exclusion)) {
      candidates.push_back(&token);
    }
  }

  // Reading order; equal x keeps stream order
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const TextToken *a, const TextToken *b) {
                     return a->boundingBox.x < b->boundingBox.x;
                   });

  std::string value;
  for (const TextToken *candidate : candidates) {
    if (!value.empty()) {
      value += ' ';
    }
    value += candidate->text;
  }
  return value;
}

std::vector<ExtractedField> extractFields(const std::vector<TextToken> &tokens,
                                          const std::vector<FieldSpec> &specs,
                                          const ExtractionOptions &options) {
  std::vector<ExtractedField> fields;
  fields.reserve(specs.size());

  for (const auto &spec : specs) {
    ExtractedField field;
    field.label = spec.label;

    const TextToken *labelToken = locateLabel(spec.label, tokens);
    if (labelToken != nullptr) {
      field.labelFound = true;
      field.value =
          associateValue(*labelToken, tokens, spec.maxHorizontalDistance,
                         options.minConfidence, options.selfExclusion);
    }

    if (spec.type == FieldType::Name) {
      field.parsedName = parseName(field.value);
      field.hasParsedName = true;
    }

    fields.push_back(field);
  }

  return fields;
}

} // namespace facesheet
