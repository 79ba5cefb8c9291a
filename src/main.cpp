#include "FieldConfig.hpp"
#include "FieldExtraction.hpp"
#include "FieldVisualizer.hpp"
#include "PageProcessor.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::vector<std::string> splitExtensions(const std::string &list) {
  std::vector<std::string> extensions;
  std::stringstream stream(list);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (item.empty()) {
      continue;
    }
    if (item[0] != '.') {
      item = "." + item;
    }
    extensions.push_back(toLower(item));
  }
  return extensions;
}

// Lists the pages to process: the input itself, or the matching files of a
// directory in file-name order.
std::vector<fs::path> collectPages(const fs::path &input,
                                   const std::vector<std::string> &extensions) {
  std::vector<fs::path> pages;
  if (!fs::is_directory(input)) {
    pages.push_back(input);
    return pages;
  }

  for (const auto &entry : fs::directory_iterator(input)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    std::string extension = toLower(entry.path().extension().string());
    if (std::find(extensions.begin(), extensions.end(), extension) !=
        extensions.end()) {
      pages.push_back(entry.path());
    }
  }

  std::sort(pages.begin(), pages.end());
  return pages;
}

void printFields(const std::vector<facesheet::ExtractedField> &fields) {
  for (const auto &field : fields) {
    std::cout << field.label << ": " << field.value << "\n";
    if (field.hasParsedName) {
      std::cout << field.label << " Parsed: (" << field.parsedName.first
                << ", " << field.parsedName.middle << ", "
                << field.parsedName.last << ")\n";
    }
  }
}

json toJson(const facesheet::PageReport &report) {
  json page;
  page["page"] = report.page;
  page["success"] = report.success;
  if (!report.success) {
    page["error"] = report.errorMessage;
  }

  json fields = json::array();
  for (const auto &field : report.fields) {
    json entry;
    entry["label"] = field.label;
    entry["value"] = field.value;
    entry["label_found"] = field.labelFound;
    if (field.hasParsedName) {
      entry["parsed"] = {{"first", field.parsedName.first},
                         {"middle", field.parsedName.middle},
                         {"last", field.parsedName.last}};
    }
    fields.push_back(entry);
  }
  page["fields"] = fields;
  return page;
}

bool writeJsonReport(const std::string &path,
                     const std::vector<facesheet::PageReport> &reports) {
  json document;
  document["pages"] = json::array();
  for (const auto &report : reports) {
    document["pages"].push_back(toJson(report));
  }

  std::ofstream out(path);
  if (!out) {
    std::cerr << "Failed to open JSON output: " << path << "\n";
    return false;
  }
  out << document.dump(2) << "\n";
  return static_cast<bool>(out);
}

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <input> [options]\n"
      << "\n<input> is a facesheet image, a Tesseract .tsv file, or a\n"
      << "directory of them.\n"
      << "\nOptions:\n"
      << "  -c, --config <file>         Field configuration (default: "
         "config/fields.json)\n"
      << "  -l, --language <lang>       Set OCR language (default: eng)\n"
      << "  -t, --tessdata <dir>        Path to tessdata directory\n"
      << "  -m, --min-confidence <val>  Candidate confidence floor (default: "
         "10)\n"
      << "      --exclude-by-text       Exclude tokens whose text equals the "
         "label\n"
      << "  -j, --json <file>           Write results as JSON\n"
      << "      --preprocess            Grayscale, blur and adaptive threshold "
         "before OCR\n"
      << "  -d, --debug <dir>           Write field overlay images\n"
      << "      --show                  Display field overlays in a window\n"
      << "      --extensions <list>     Page extensions in a directory "
         "(default: .jpg)\n"
      << "  -v, --verbose               Print progress details\n"
      << "  -h, --help                  Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " bin/facesheets -c config/fields.json\n"
      << "  " << programName << " page1.jpg -j fields.json -d debug\n"
      << "  " << programName << " page1.tsv --exclude-by-text\n";
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string inputPath;
  std::string configPath = "config/fields.json";
  std::string jsonPath;
  std::string debugDir;
  std::string extensionList = ".jpg";
  bool verbose = false;
  bool show = false;
  facesheet::OCRConfig ocrConfig;
  facesheet::ExtractionOptions options;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto requireValue = [&](const std::string &name) -> const char * {
      if (i + 1 < argc) {
        return argv[++i];
      }
      std::cerr << "Error: " << name << " requires an argument\n";
      return nullptr;
    };

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-c" || arg == "--config") {
      const char *value = requireValue("--config");
      if (value == nullptr) {
        return 1;
      }
      configPath = value;
    } else if (arg == "-l" || arg == "--language") {
      const char *value = requireValue("--language");
      if (value == nullptr) {
        return 1;
      }
      ocrConfig.language = value;
    } else if (arg == "-t" || arg == "--tessdata") {
      const char *value = requireValue("--tessdata");
      if (value == nullptr) {
        return 1;
      }
      ocrConfig.tessDataPath = value;
    } else if (arg == "-m" || arg == "--min-confidence") {
      const char *value = requireValue("--min-confidence");
      if (value == nullptr) {
        return 1;
      }
      try {
        options.minConfidence = std::stof(value);
      } catch (const std::exception &) {
        std::cerr << "Error: invalid --min-confidence value: " << value
                  << "\n";
        return 1;
      }
    } else if (arg == "--exclude-by-text") {
      options.selfExclusion = facesheet::SelfExclusion::ByText;
    } else if (arg == "--preprocess") {
      ocrConfig.preprocessImage = true;
    } else if (arg == "-j" || arg == "--json") {
      const char *value = requireValue("--json");
      if (value == nullptr) {
        return 1;
      }
      jsonPath = value;
    } else if (arg == "-d" || arg == "--debug") {
      const char *value = requireValue("--debug");
      if (value == nullptr) {
        return 1;
      }
      debugDir = value;
    } else if (arg == "--show") {
      show = true;
    } else if (arg == "--extensions") {
      const char *value = requireValue("--extensions");
      if (value == nullptr) {
        return 1;
      }
      extensionList = value;
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg[0] != '-') {
      inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (inputPath.empty()) {
    std::cerr << "Error: No input path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  std::error_code existsError;
  if (!fs::exists(inputPath, existsError) || existsError) {
    std::cerr << "Error: Input not found: " << inputPath;
    if (existsError) {
      std::cerr << " (" << existsError.message() << ")";
    }
    std::cerr << "\n";
    return 1;
  }

  facesheet::FieldConfigResult config = facesheet::loadFieldConfig(configPath);
  if (!config.success) {
    std::cerr << "Error: " << config.errorMessage << "\n";
    return 1;
  }

  if (verbose) {
    std::cerr << "DEBUG: Loaded " << config.fields.size()
              << " field(s) from " << configPath << std::endl;
    for (const auto &spec : config.fields) {
      std::cerr << "DEBUG:   " << std::setw(20) << std::left << spec.label
                << " distance=" << spec.maxHorizontalDistance
                << " type=" << facesheet::fieldTypeName(spec.type)
                << std::endl;
    }
  }

  std::vector<fs::path> pages;
  try {
    pages = collectPages(inputPath, splitExtensions(extensionList));
  } catch (const fs::filesystem_error &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (pages.empty()) {
    std::cerr << "Error: No pages found in " << inputPath << "\n";
    return 1;
  }

  if (!debugDir.empty()) {
    std::error_code ec;
    fs::create_directories(debugDir, ec);
    if (ec) {
      std::cerr << "Error: Cannot create debug directory " << debugDir << ": "
                << ec.message() << "\n";
      return 1;
    }
  }

  std::vector<std::string> pagePaths;
  for (const auto &page : pages) {
    pagePaths.push_back(page.string());
  }

  facesheet::PageProcessor processor(config.fields, options, ocrConfig);
  processor.setVerbose(verbose);
  facesheet::BatchResult batch = processor.processPages(pagePaths);

  for (size_t i = 0; i < batch.reports.size(); ++i) {
    const facesheet::PageReport &report = batch.reports[i];
    std::cout << "Page: " << report.page << "\n";
    if (!report.success) {
      continue;
    }

    if (verbose) {
      std::cerr << "DEBUG: " << report.tokens.size() << " tokens in "
                << std::fixed << std::setprecision(2)
                << report.processingTimeMs << " ms" << std::endl;
    }
    printFields(report.fields);

    if ((debugDir.empty() && !show) ||
        facesheet::PageProcessor::isTSVPage(pagePaths[i])) {
      continue;
    }

    cv::Mat overlay = cv::imread(pagePaths[i]);
    if (overlay.empty()) {
      std::cerr << "Failed to load image for overlay: " << pagePaths[i]
                << "\n";
      continue;
    }
    facesheet::FieldVisualizer::drawTokens(overlay, report.tokens);
    facesheet::FieldVisualizer::drawExtraction(overlay, report.tokens,
                                               config.fields, report.fields);
    overlay = facesheet::FieldVisualizer::resizeToWidth(overlay, 1000);

    if (!debugDir.empty()) {
      fs::path outPath =
          fs::path(debugDir) / (pages[i].stem().string() + "_fields.png");
      if (cv::imwrite(outPath.string(), overlay)) {
        if (verbose) {
          std::cerr << "DEBUG: Overlay saved to " << outPath.string()
                    << std::endl;
        }
      } else {
        std::cerr << "Failed to write overlay: " << outPath.string() << "\n";
      }
    }

    if (show) {
      facesheet::FieldVisualizer::showImage(overlay, report.page);
    }
  }

  if (!jsonPath.empty()) {
    if (!writeJsonReport(jsonPath, batch.reports)) {
      return 1;
    }
    std::cout << "Results written to " << jsonPath << "\n";
  }

  return batch.failedPages > 0 ? 1 : 0;
}
