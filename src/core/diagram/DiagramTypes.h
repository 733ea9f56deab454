/**
 * @file DiagramTypes.h
 * @brief Core type definitions for the CircuitSketch diagram model
 *
 * Fundamental aliases, enums and constants shared by shapes, wires,
 * components and terminals.
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_TYPES_H
#define CIRCUITSKETCH_CORE_DIAGRAM_TYPES_H

#include <string>

namespace circuitsketch::core::diagram {

//==============================================================================
// Entity Types
//==============================================================================

/**
 * @brief Enumeration of editable entity types
 */
enum class EntityType {
    Wire,
    Component
};

/**
 * @brief Selection handle marker shapes
 */
enum class HandleType {
    Square,     // Terminal anchors (not editable through the wire)
    Dot         // Interior wire nodes
};

//==============================================================================
// Type Aliases
//==============================================================================

/**
 * @brief Entity identifier - UUID string
 */
using EntityID = std::string;

/**
 * @brief Terminal identifier - opaque string owned by the component
 */
using TerminalID = std::string;

//==============================================================================
// Constants
//==============================================================================

namespace constants {

/// Extra hit-test distance added on top of half the stroke width (px)
constexpr double DEFAULT_HIT_MARGIN = 5.0;

/// Default wire stroke width (px)
constexpr double DEFAULT_WIRE_WIDTH = 2.0;

/// Default stroke color for wires and component outlines
constexpr const char* DEFAULT_STROKE_COLOR = "#000000";

/// Default terminal marker radius (px)
constexpr double DEFAULT_TERMINAL_RADIUS = 4.0;

/// Default terminal fill color
constexpr const char* DEFAULT_TERMINAL_COLOR = "#0000FF";

/// Extra slack for terminal picking on top of radius + parent margin (px)
constexpr double TERMINAL_PICK_SLACK = 2.0;

/// Default selection handle edge length (px)
constexpr double DEFAULT_HANDLE_SIZE = 5.0;

} // namespace constants

//==============================================================================
// Forward Declarations
//==============================================================================

class Shape;
class Wire;
class Component;
class Terminal;

} // namespace circuitsketch::core::diagram

#endif // CIRCUITSKETCH_CORE_DIAGRAM_TYPES_H
