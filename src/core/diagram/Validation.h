/**
 * @file Validation.h
 * @brief Shared value checks used by the fail-soft setters
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_VALIDATION_H
#define CIRCUITSKETCH_CORE_DIAGRAM_VALIDATION_H

#include "FieldResult.h"

#include <QJsonValue>
#include <gp_Pnt2d.hxx>

#include <optional>
#include <string>
#include <vector>

namespace circuitsketch::core::diagram::validation {

/**
 * @brief True if Qt can parse @p color (#RGB, #RRGGBB, #AARRGGBB, SVG names)
 */
bool isValidColor(const std::string& color);

/**
 * @brief Finite and >= 0
 */
bool isNonNegative(double value);

/**
 * @brief Read a JSON number; nullopt for any other type or a non-finite value
 */
std::optional<double> numberFrom(const QJsonValue& value);

/**
 * @brief Read a JSON array of non-negative numbers
 */
std::optional<std::vector<double>> dashPatternFrom(const QJsonValue& value);

/**
 * @brief Read a JSON array of {x, y} objects with numeric coordinates
 */
std::optional<std::vector<gp_Pnt2d>> pointListFrom(const QJsonValue& value);

} // namespace circuitsketch::core::diagram::validation

#endif // CIRCUITSKETCH_CORE_DIAGRAM_VALIDATION_H
