#include "TextToken.hpp"

#include <iostream>
#include <string>

namespace {

int failures = 0;

void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  PASS " : "  FAIL ") << description
            << std::endl;
  if (!condition) {
    failures++;
  }
}

// Excerpt of `tesseract facesheet.jpg out tsv`
const char *kSampleTSV =
    "level\tpage_num\tblock_num\tpar_num\tline_num\tword_num\tleft\ttop\twidth"
    "\theight\tconf\ttext\n"
    "1\t1\t0\t0\t0\t0\t0\t0\t1700\t2200\t-1\t\n"
    "2\t1\t1\t0\t0\t0\t120\t210\t900\t40\t-1\t\n"
    "4\t1\t1\t1\t1\t0\t120\t210\t900\t40\t-1\t\n"
    "5\t1\t1\t1\t1\t1\t120\t212\t95\t30\t96.581345\tVisit\n"
    "5\t1\t1\t1\t1\t2\t225\t212\t48\t30\t95.1\tID:\n"
    "5\t1\t1\t1\t1\t3\t290\t214\t120\t28\t91\t00045812\n"
    "5\t1\t1\t1\t1\t4\t420\t214\t10\t28\t95\t \n"
    "5\t1\t1\t1\t1\t5\tbad\t214\t10\t28\t95\tBroken\n"
    "5\t1\t1\t1\t2\t1\t120\t260\t80\t30\t12.5\tMRN\r\n";

} // anonymous namespace

int main() {
  std::cout << "=== Test token table ===" << std::endl << std::endl;

  std::cout << "parseTesseractTSV:" << std::endl;
  facesheet::TokenTable table = facesheet::parseTesseractTSV(kSampleTSV);
  check(table.size() == 8,
        "header and malformed rows are skipped (size " +
            std::to_string(table.size()) + ")");
  check(table.isConsistent(), "all columns have the same length");
  if (table.size() == 8) {
    check(table.text[3] == "Visit" && table.left[3] == 120 &&
              table.top[3] == 212 && table.width[3] == 95 &&
              table.height[3] == 30,
          "word row columns are mapped by position");
    check(table.conf[3] > 96.5f && table.conf[3] < 96.6f,
          "fractional confidence is parsed");
    check(table.text[0].empty() && table.conf[0] < 0,
          "structural rows keep empty text and -1 confidence");
    check(table.text[7] == "MRN", "carriage return is stripped");
  }

  std::cout << std::endl << "tokensFromTable:" << std::endl;
  facesheet::TokenConversionResult conversion =
      facesheet::tokensFromTable(table);
  check(conversion.success, "consistent table converts");
  check(conversion.tokens.size() == 4,
        "structural and blank entries are dropped (got " +
            std::to_string(conversion.tokens.size()) + ")");
  if (conversion.tokens.size() == 4) {
    check(conversion.tokens[0].text == "Visit" &&
              conversion.tokens[1].text == "ID:" &&
              conversion.tokens[2].text == "00045812" &&
              conversion.tokens[3].text == "MRN",
          "table order is preserved");
    check(conversion.tokens[2].boundingBox == cv::Rect(290, 214, 120, 28),
          "bounding box is built from left/top/width/height");
    check(conversion.tokens[3].confidence == 12.5f,
          "low confidence tokens are kept for label search");
  }

  facesheet::TokenTable broken = table;
  broken.conf.pop_back();
  facesheet::TokenConversionResult failed = facesheet::tokensFromTable(broken);
  check(!failed.success && !failed.errorMessage.empty() &&
            failed.tokens.empty(),
        "columns of different length are rejected");

  facesheet::TokenTable noLevel = table;
  noLevel.level.clear();
  check(noLevel.isConsistent(), "level column is optional");

  std::cout << std::endl << "tableFromTokens:" << std::endl;
  facesheet::TokenTable rebuilt = facesheet::tableFromTokens(conversion.tokens);
  check(rebuilt.isConsistent() && rebuilt.size() == conversion.tokens.size(),
        "tokens convert back to parallel arrays");
  if (rebuilt.size() == 4) {
    check(rebuilt.left[2] == 290 && rebuilt.top[2] == 214 &&
              rebuilt.width[2] == 120 && rebuilt.height[2] == 28 &&
              rebuilt.text[2] == "00045812" && rebuilt.level[2] == 5,
          "columns are index aligned");
  }

  facesheet::TokenTable empty = facesheet::parseTesseractTSV("");
  check(empty.size() == 0 && empty.isConsistent(), "empty input gives empty table");

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All token table checks passed" << std::endl;
  return 0;
}
