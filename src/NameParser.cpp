#include "NameParser.hpp"

#include <vector>

namespace facesheet {

namespace {

std::string trim(const std::string &s) {
  size_t start = s.find_first_not_of(" \t\n\r\f\v");
  size_t end = s.find_last_not_of(" \t\n\r\f\v");
  if (start == std::string::npos || end == std::string::npos) {
    return "";
  }
  return s.substr(start, end - start + 1);
}

// Splits on every single space, so "a  b" yields an empty middle part and ""
// yields one empty part.
std::vector<std::string> splitSpaces(const std::string &s) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t space = s.find(' ', start);
    if (space == std::string::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, space - start));
    start = space + 1;
  }
  return parts;
}

} // anonymous namespace

ParsedName parseName(const std::string &text) {
  ParsedName name;

  size_t comma = text.find(',');
  if (comma != std::string::npos) {
    std::string lastPart = text.substr(0, comma);
    std::vector<std::string> parts = splitSpaces(trim(text.substr(comma + 1)));

    if (parts.size() == 2) {
      name.first = parts[0];
      name.middle = parts[1];
      name.last = lastPart;
    } else if (parts.size() == 1) {
      name.first = parts[0];
      name.last = lastPart;
    } else {
      // Remainder is not "First [Middle]"
      name.first = lastPart;
    }
  } else {
    std::vector<std::string> parts = splitSpaces(text);

    if (parts.size() == 3) {
      name.first = parts[0];
      name.middle = parts[1];
      name.last = parts[2];
    } else if (parts.size() == 2) {
      name.first = parts[0];
      name.middle = parts[1];
    } else if (parts.size() == 1) {
      name.first = parts[0];
    }
  }

  name.first = trim(name.first);
  name.middle = trim(name.middle);
  name.last = trim(name.last);
  return name;
}

} // namespace facesheet
