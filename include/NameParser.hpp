#ifndef NAME_PARSER_HPP
#define NAME_PARSER_HPP

#include <string>

namespace facesheet {

/**
 * @brief Name split into its components; absent parts are empty
 */
struct ParsedName {
  std::string first;
  std::string middle;
  std::string last;
};

/**
 * @brief Split a free-text name into first, middle and last name
 *
 * Two notations are recognized, selected by the presence of a comma:
 * - "Last, First Middle": the text before the first comma is the last name.
 *   If the remainder does not hold one or two words, the text before the
 *   comma is returned as the first name and the last name is left empty.
 * - "First Middle Last": one to three space-separated words. Any other word
 *   count leaves all components empty.
 *
 * Never fails. Every component is whitespace-trimmed.
 *
 * @param text Name text as assembled from the page
 * @return Parsed components
 */
ParsedName parseName(const std::string &text);

} // namespace facesheet

#endif // NAME_PARSER_HPP
