#include "TextToken.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace facesheet {

namespace {

const int kWordLevel = 5;
const size_t kTSVColumns = 12;

bool isBlank(const std::string &text) {
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> splitTabs(const std::string &line) {
  std::vector<std::string> columns;
  size_t start = 0;
  while (true) {
    size_t tab = line.find('\t', start);
    if (tab == std::string::npos) {
      columns.push_back(line.substr(start));
      break;
    }
    columns.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }
  return columns;
}

} // anonymous namespace

bool TokenTable::isConsistent() const {
  const size_t n = text.size();
  return left.size() == n && top.size() == n && width.size() == n &&
         height.size() == n && conf.size() == n &&
         (level.empty() || level.size() == n);
}

TokenConversionResult tokensFromTable(const TokenTable &table) {
  TokenConversionResult result;
  result.success = false;

  if (!table.isConsistent()) {
    std::ostringstream msg;
    msg << "Token table columns differ in length (text=" << table.text.size()
        << ", left=" << table.left.size() << ", top=" << table.top.size()
        << ", width=" << table.width.size()
        << ", height=" << table.height.size()
        << ", conf=" << table.conf.size() << ", level=" << table.level.size()
        << ")";
    result.errorMessage = msg.str();
    return result;
  }

  result.tokens.reserve(table.size());
  for (size_t i = 0; i < table.size(); ++i) {
    if (table.conf[i] < 0.0f || isBlank(table.text[i])) {
      continue;
    }

    TextToken token;
    token.text = table.text[i];
    token.boundingBox =
        cv::Rect(table.left[i], table.top[i], table.width[i], table.height[i]);
    token.confidence = table.conf[i];
    result.tokens.push_back(token);
  }

  result.success = true;
  return result;
}

TokenTable tableFromTokens(const std::vector<TextToken> &tokens) {
  TokenTable table;
  for (const auto &token : tokens) {
    table.level.push_back(kWordLevel);
    table.left.push_back(token.boundingBox.x);
    table.top.push_back(token.boundingBox.y);
    table.width.push_back(token.boundingBox.width);
    table.height.push_back(token.boundingBox.height);
    table.conf.push_back(token.confidence);
    table.text.push_back(token.text);
  }
  return table;
}

TokenTable parseTesseractTSV(const std::string &tsv) {
  TokenTable table;
  std::istringstream stream(tsv);
  std::string line;

  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.rfind("level", 0) == 0) {
      continue;
    }

    std::vector<std::string> columns = splitTabs(line);
    if (columns.size() < kTSVColumns - 1) {
      continue;
    }
    // Structural rows may omit the trailing text column
    if (columns.size() == kTSVColumns - 1) {
      columns.emplace_back();
    }

    try {
      int level = std::stoi(columns[0]);
      int left = std::stoi(columns[6]);
      int top = std::stoi(columns[7]);
      int width = std::stoi(columns[8]);
      int height = std::stoi(columns[9]);
      float conf = std::stof(columns[10]);

      table.level.push_back(level);
      table.left.push_back(left);
      table.top.push_back(top);
      table.width.push_back(width);
      table.height.push_back(height);
      table.conf.push_back(conf);
      table.text.push_back(columns[11]);
    } catch (const std::invalid_argument &) {
      continue;
    } catch (const std::out_of_range &) {
      continue;
    }
  }

  return table;
}

} // namespace facesheet
