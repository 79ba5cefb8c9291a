#include "NameParser.hpp"

#include <iostream>
#include <string>

namespace {

int failures = 0;

void expectName(const std::string &input, const std::string &first,
                const std::string &middle, const std::string &last) {
  facesheet::ParsedName name = facesheet::parseName(input);
  bool ok = name.first == first && name.middle == middle && name.last == last;

  std::cout << (ok ? "  PASS " : "  FAIL ") << "\"" << input << "\" -> ("
            << name.first << ", " << name.middle << ", " << name.last << ")";
  if (!ok) {
    std::cout << "  expected (" << first << ", " << middle << ", " << last
              << ")";
    failures++;
  }
  std::cout << std::endl;
}

} // anonymous namespace

int main() {
  std::cout << "=== Test parseName ===" << std::endl << std::endl;

  std::cout << "Comma notation:" << std::endl;
  expectName("Smith, John Robert", "John", "Robert", "Smith");
  expectName("Smith, John", "John", "", "Smith");
  expectName("Smith,John", "John", "", "Smith");
  expectName("  Smith , John Robert  ", "John", "Robert", "Smith");
  // Remainder with three words falls back to the text before the comma
  expectName("Smith, John Robert Jr", "Smith", "", "");
  // Double space yields an empty middle word, so three parts
  expectName("Smith, John  Robert", "Smith", "", "");
  // Only the first comma separates the last name
  expectName("Smith, John, Robert", "John,", "Robert", "Smith");
  expectName("Smith,", "", "", "Smith");

  std::cout << std::endl << "Space notation:" << std::endl;
  expectName("John Robert Smith", "John", "Robert", "Smith");
  expectName("John Robert", "John", "Robert", "");
  expectName("Madonna", "Madonna", "", "");
  expectName("", "", "", "");
  // Four or more words assign nothing
  expectName("John Robert Smith Jr", "", "", "");
  expectName("Mary Ann Van Dyke", "", "", "");

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All name parser checks passed" << std::endl;
  return 0;
}
