#ifndef FIELD_CONFIG_HPP
#define FIELD_CONFIG_HPP

#include "FieldExtraction.hpp"

#include <string>
#include <vector>

namespace facesheet {

/**
 * @brief Result of loading a field configuration
 */
struct FieldConfigResult {
  bool success = false;          ///< Whether every row was valid
  std::string errorMessage;      ///< Error message if failed
  std::vector<FieldSpec> fields; ///< Fields in configuration order
};

/**
 * @brief Map a configured field type name to FieldType
 *
 * "Name" selects FieldType::Name; any other value is FieldType::Plain.
 */
FieldType parseFieldType(const std::string &name);

/**
 * @brief Name of a field type as written in configuration files
 */
std::string fieldTypeName(FieldType type);

/**
 * @brief Parse a field configuration from JSON text
 *
 * The document is either an array of rows or an object with a "fields" array.
 * A row is either an object
 * @code
 * {"label": "Visit", "max_horizontal_distance": 100, "field_type": "Plain"}
 * @endcode
 * or an array in column order
 * @code
 * ["Visit", 100, "Plain"]
 * @endcode
 * field_type is optional and defaults to "Plain".
 *
 * @param jsonText Configuration document
 * @return FieldConfigResult; on failure errorMessage names the bad row
 */
FieldConfigResult parseFieldConfig(const std::string &jsonText);

/**
 * @brief Load a field configuration file
 * @param path Path to the JSON configuration
 * @return FieldConfigResult containing the fields
 */
FieldConfigResult loadFieldConfig(const std::string &path);

} // namespace facesheet

#endif // FIELD_CONFIG_HPP
