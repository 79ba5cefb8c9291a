#include "FieldConfig.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace facesheet {

namespace {

// Reads one row into spec; returns an empty string on success, otherwise the
// reason the row was rejected.
std::string readRow(const json &row, FieldSpec &spec) {
  json label;
  json distance;
  json type;

  if (row.is_object()) {
    if (!row.contains("label")) {
      return "missing \"label\"";
    }
    if (!row.contains("max_horizontal_distance")) {
      return "missing \"max_horizontal_distance\"";
    }
    label = row["label"];
    distance = row["max_horizontal_distance"];
    if (row.contains("field_type")) {
      type = row["field_type"];
    }
  } else if (row.is_array()) {
    if (row.size() < 2) {
      return "expected [label, max_horizontal_distance, field_type]";
    }
    label = row[0];
    distance = row[1];
    if (row.size() > 2) {
      type = row[2];
    }
  } else {
    return "row must be an object or an array";
  }

  if (!label.is_string()) {
    return "label must be a string";
  }

  const int maxDistance = std::numeric_limits<int>::max();
  if (distance.is_number_unsigned()) {
    std::uint64_t value = distance.get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(maxDistance)) {
      return "max_horizontal_distance out of range";
    }
    spec.maxHorizontalDistance = static_cast<int>(value);
  } else if (distance.is_number_integer()) {
    // Signed storage is only used for negative numbers
    return "max_horizontal_distance out of range";
  } else if (distance.is_number_float()) {
    double value = distance.get<double>();
    if (std::floor(value) != value) {
      return "max_horizontal_distance must be an integer";
    }
    if (value < 0 || value > static_cast<double>(maxDistance)) {
      return "max_horizontal_distance out of range";
    }
    spec.maxHorizontalDistance = static_cast<int>(value);
  } else {
    return "max_horizontal_distance must be an integer";
  }

  if (type.is_null()) {
    spec.type = FieldType::Plain;
  } else if (type.is_string()) {
    spec.type = parseFieldType(type.get<std::string>());
  } else {
    return "field_type must be a string";
  }

  spec.label = label.get<std::string>();
  return "";
}

} // anonymous namespace

FieldType parseFieldType(const std::string &name) {
  return name == "Name" ? FieldType::Name : FieldType::Plain;
}

std::string fieldTypeName(FieldType type) {
  switch (type) {
  case FieldType::Name:
    return "Name";
  case FieldType::Plain:
  default:
    return "Plain";
  }
}

FieldConfigResult parseFieldConfig(const std::string &jsonText) {
  FieldConfigResult result;
  result.success = false;

  json document;
  try {
    document = json::parse(jsonText);
  } catch (const json::parse_error &e) {
    result.errorMessage = std::string("Invalid field configuration: ") +
                          e.what();
    return result;
  }

  const json *rows = &document;
  if (document.is_object()) {
    if (!document.contains("fields")) {
      result.errorMessage =
          "Invalid field configuration: object has no \"fields\" array";
      return result;
    }
    rows = &document["fields"];
  }

  if (!rows->is_array()) {
    result.errorMessage =
        "Invalid field configuration: expected an array of fields";
    return result;
  }

  if (rows->empty()) {
    result.errorMessage = "Field configuration contains no fields";
    return result;
  }

  for (size_t i = 0; i < rows->size(); ++i) {
    FieldSpec spec;
    std::string error = readRow((*rows)[i], spec);
    if (!error.empty()) {
      std::ostringstream msg;
      msg << "Invalid field configuration row " << i << ": " << error;
      result.errorMessage = msg.str();
      result.fields.clear();
      return result;
    }
    result.fields.push_back(spec);
  }

  result.success = true;
  return result;
}

FieldConfigResult loadFieldConfig(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    FieldConfigResult result;
    result.success = false;
    result.errorMessage = "Failed to open field configuration: " + path;
    return result;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parseFieldConfig(buffer.str());
}

} // namespace facesheet
