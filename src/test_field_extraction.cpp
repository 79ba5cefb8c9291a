#include "FieldExtraction.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  PASS " : "  FAIL ") << description
            << std::endl;
  if (!condition) {
    failures++;
  }
}

facesheet::TextToken makeToken(const std::string &text, int x, int y,
                               int width = 40, int height = 15,
                               float confidence = 90.0f) {
  facesheet::TextToken token;
  token.text = text;
  token.boundingBox = cv::Rect(x, y, width, height);
  token.confidence = confidence;
  return token;
}

// Small facesheet: two label/value rows and a distant column
std::vector<facesheet::TextToken> sampleSheet() {
  return {
      makeToken("Patient", 20, 100, 60),
      makeToken("Name:", 85, 101, 50),
      makeToken("Smith,", 150, 100, 60),
      makeToken("John", 215, 102, 45),
      makeToken("Robert", 265, 99, 60),
      makeToken("MR#:", 500, 100, 40),
      makeToken("00123", 550, 100, 60),
      makeToken("DOB:", 20, 140, 40),
      makeToken("01/02/1960", 70, 141, 90),
      makeToken("Age:", 300, 140, 40),
      makeToken("64", 350, 140, 20),
  };
}

void testLocateLabel() {
  std::cout << "locateLabel:" << std::endl;

  std::vector<facesheet::TextToken> tokens = {
      makeToken("Visitor:", 10, 10), makeToken("Visit", 10, 50),
      makeToken("VISIT", 10, 90)};

  const facesheet::TextToken *found = facesheet::locateLabel("Visit", tokens);
  check(found == &tokens[0], "prefix match returns the first token in order");

  found = facesheet::locateLabel("visit", tokens);
  check(found == &tokens[0], "matching ignores case");

  found = facesheet::locateLabel("isit", tokens);
  check(found == nullptr, "substring that is not a prefix does not match");

  found = facesheet::locateLabel("Gender", tokens);
  check(found == nullptr, "missing label returns nullptr");

  std::vector<facesheet::TextToken> lowConfidence = {
      makeToken("SSN", 10, 10, 40, 15, 1.0f)};
  found = facesheet::locateLabel("SSN", lowConfidence);
  check(found == &lowConfidence[0], "label search ignores confidence");

  std::vector<facesheet::TextToken> empty;
  check(facesheet::locateLabel("Visit", empty) == nullptr,
        "empty token stream returns nullptr");
}

void testAssociateValue() {
  std::cout << std::endl << "associateValue:" << std::endl;

  // The end-to-end example: "ID:" carries a colon and is rejected
  std::vector<facesheet::TextToken> tokens = {
      makeToken("Visit", 10, 10, 40, 15), makeToken("ID:", 55, 10, 20, 15),
      makeToken("12345", 80, 12, 40, 15)};
  std::string value = facesheet::associateValue(tokens[0], tokens, 100);
  check(value == "12345", "colon-bearing token is excluded (got \"" + value +
                              "\")");

  // Vertical tolerance is exclusive at 10
  std::vector<facesheet::TextToken> rows = {
      makeToken("Age", 10, 100), makeToken("nine", 60, 109),
      makeToken("ten", 80, 110), makeToken("above", 100, 91),
      makeToken("below", 120, 90)};
  value = facesheet::associateValue(rows[0], rows, 200);
  check(value == "nine above", "only |dy| < 10 is on the same line (got \"" +
                                   value + "\")");

  // Horizontal band is open on both ends
  std::vector<facesheet::TextToken> band = {
      makeToken("MR", 100, 50), makeToken("same", 100, 50),
      makeToken("left", 90, 50), makeToken("inside", 149, 50),
      makeToken("edge", 150, 50)};
  value = facesheet::associateValue(band[0], band, 50);
  check(value == "inside",
        "0 < dx < max is required (got \"" + value + "\")");

  // Output is ordered by x regardless of input order
  std::vector<facesheet::TextToken> shuffled = {
      makeToken("C", 300, 20), makeToken("Name", 10, 20),
      makeToken("A", 100, 22), makeToken("B", 200, 18)};
  value = facesheet::associateValue(shuffled[1], shuffled, 500);
  check(value == "A B C", "values are joined left to right (got \"" + value +
                              "\")");

  std::vector<facesheet::TextToken> reversed(shuffled.rbegin(),
                                             shuffled.rend());
  std::string reversedValue =
      facesheet::associateValue(reversed[2], reversed, 500);
  check(reversedValue == value, "result does not depend on input order");

  // Confidence floor applies to candidates
  std::vector<facesheet::TextToken> noisy = {
      makeToken("SSN", 10, 10), makeToken("123-45-6789", 60, 10, 90, 15, 85.0f),
      makeToken("~", 160, 10, 5, 15, 9.9f),
      makeToken("x", 170, 10, 5, 15, 10.0f)};
  value = facesheet::associateValue(noisy[0], noisy, 300);
  check(value == "123-45-6789 x",
        "tokens below 10 confidence are dropped (got \"" + value + "\")");
  value = facesheet::associateValue(noisy[0], noisy, 300, 0.0f);
  check(value == "123-45-6789 ~ x",
        "custom confidence floor is honored (got \"" + value + "\")");

  std::vector<facesheet::TextToken> alone = {makeToken("Gender", 10, 10)};
  value = facesheet::associateValue(alone[0], alone, 100);
  check(value.empty(), "no candidates gives an empty value");
}

void testSelfExclusion() {
  std::cout << std::endl << "self-exclusion:" << std::endl;

  // A value token that repeats the label text
  std::vector<facesheet::TextToken> tokens = {makeToken("Male", 10, 10),
                                              makeToken("Male", 80, 10)};

  std::string byIdentity = facesheet::associateValue(
      tokens[0], tokens, 200, facesheet::kDefaultMinConfidence,
      facesheet::SelfExclusion::ByIdentity);
  check(byIdentity == "Male", "identity mode keeps a token equal to the label");

  std::string byText = facesheet::associateValue(
      tokens[0], tokens, 200, facesheet::kDefaultMinConfidence,
      facesheet::SelfExclusion::ByText);
  check(byText.empty(), "text mode drops every token equal to the label");

  check(!facesheet::isValueCandidate(tokens[0], tokens[0], 200, 0.0f,
                                     facesheet::SelfExclusion::ByIdentity),
        "the label token is never its own candidate");
}

void testExtractFields() {
  std::cout << std::endl << "extractFields:" << std::endl;

  std::vector<facesheet::TextToken> tokens = sampleSheet();
  std::vector<facesheet::FieldSpec> specs = {
      {"Patient", 300, facesheet::FieldType::Name},
      {"MR", 100, facesheet::FieldType::Plain},
      {"DOB", 150, facesheet::FieldType::Plain},
      {"SSN", 100, facesheet::FieldType::Plain},
      {"Age", 60, facesheet::FieldType::Plain},
      {"Guarantor", 300, facesheet::FieldType::Name}};

  std::vector<facesheet::ExtractedField> fields =
      facesheet::extractFields(tokens, specs);

  check(fields.size() == specs.size(), "one result per spec");
  bool ordered = true;
  for (size_t i = 0; i < fields.size() && i < specs.size(); ++i) {
    ordered = ordered && fields[i].label == specs[i].label;
  }
  check(ordered, "results follow configuration order");

  if (fields.size() == specs.size()) {
    check(fields[0].labelFound && fields[0].value == "Smith, John Robert",
          "name value skips the \"Name:\" label (got \"" + fields[0].value +
              "\")");
    check(fields[0].hasParsedName && fields[0].parsedName.first == "John" &&
              fields[0].parsedName.middle == "Robert" &&
              fields[0].parsedName.last == "Smith",
          "name field is decomposed");
    check(fields[1].value == "00123",
          "MR value (got \"" + fields[1].value + "\")");
    check(fields[2].value == "01/02/1960",
          "DOB value stops before the Age column (got \"" + fields[2].value +
              "\")");
    check(!fields[3].labelFound && fields[3].value.empty() &&
              !fields[3].hasParsedName,
          "missing plain field is empty and not an error");
    check(fields[4].value == "64", "Age value (got \"" + fields[4].value +
                                       "\")");
    check(!fields[5].labelFound && fields[5].hasParsedName &&
              fields[5].parsedName.first.empty() &&
              fields[5].parsedName.last.empty(),
          "missing name field has empty components");
  }

  // Fields do not consume tokens
  std::vector<facesheet::FieldSpec> overlapping = {
      {"Patient", 300, facesheet::FieldType::Plain},
      {"Name", 300, facesheet::FieldType::Plain}};
  std::vector<facesheet::ExtractedField> shared =
      facesheet::extractFields(tokens, overlapping);
  check(shared.size() == 2 && shared[1].value.find("John") != std::string::npos &&
            shared[0].value.find("John") != std::string::npos,
        "two fields may share value tokens");

  std::vector<facesheet::ExtractedField> again =
      facesheet::extractFields(tokens, specs);
  bool identical = again.size() == fields.size();
  for (size_t i = 0; identical && i < again.size(); ++i) {
    identical = again[i].value == fields[i].value &&
                again[i].labelFound == fields[i].labelFound &&
                again[i].parsedName.first == fields[i].parsedName.first &&
                again[i].parsedName.middle == fields[i].parsedName.middle &&
                again[i].parsedName.last == fields[i].parsedName.last;
  }
  check(identical, "extraction is repeatable");

  std::vector<facesheet::TextToken> endToEnd = {
      makeToken("Visit", 10, 10, 40, 15), makeToken("ID:", 55, 10, 20, 15),
      makeToken("12345", 80, 12, 40, 15)};
  std::vector<facesheet::ExtractedField> visit = facesheet::extractFields(
      endToEnd, {{"Visit", 100, facesheet::FieldType::Plain}});
  check(visit.size() == 1 && visit[0].value == "12345",
        "end-to-end visit id is \"12345\"");
}

} // anonymous namespace

int main() {
  std::cout << "=== Test field extraction ===" << std::endl << std::endl;

  testLocateLabel();
  testAssociateValue();
  testSelfExclusion();
  testExtractFields();

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All field extraction checks passed" << std::endl;
  return 0;
}
