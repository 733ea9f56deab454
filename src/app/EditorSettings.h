/**
 * @file EditorSettings.h
 * @brief User-tunable editor defaults
 */
#ifndef CIRCUITSKETCH_APP_EDITORSETTINGS_H
#define CIRCUITSKETCH_APP_EDITORSETTINGS_H

#include "../core/diagram/DiagramTypes.h"

#include <gp_Pnt2d.hxx>

#include <cstddef>
#include <string>

class QSettings;

namespace circuitsketch::core::diagram {
class Component;
class Wire;
}

namespace circuitsketch::app {

/**
 * @brief Editor defaults read from QSettings ("editor/..." keys)
 *
 * A few values can be overridden from the environment for scripted runs:
 * CIRCUITSKETCH_HIT_MARGIN, CIRCUITSKETCH_HISTORY_CAPACITY and
 * CIRCUITSKETCH_GRID_SIZE. Stored or overridden values that do not validate
 * are ignored with a warning and the default stays in effect.
 */
class EditorSettings {
public:
    EditorSettings() = default;

    /**
     * @brief Read stored values, then environment overrides
     */
    static EditorSettings load(QSettings& settings);

    void save(QSettings& settings) const;

    /**
     * @brief Apply CIRCUITSKETCH_* overrides on top of the current values
     */
    void applyEnvironment();

    double hitMargin() const { return m_hitMargin; }
    bool setHitMargin(double margin);

    const std::string& wireColor() const { return m_wireColor; }
    bool setWireColor(const std::string& color);

    double wireWidth() const { return m_wireWidth; }
    bool setWireWidth(double width);

    double terminalRadius() const { return m_terminalRadius; }
    bool setTerminalRadius(double radius);

    double gridSize() const { return m_gridSize; }
    bool setGridSize(double size);

    bool snapToGridEnabled() const { return m_snapToGrid; }
    void setSnapToGridEnabled(bool enabled) { m_snapToGrid = enabled; }

    /**
     * @brief Maximum undo states per entity, 0 for unbounded
     */
    std::size_t historyCapacity() const { return m_historyCapacity; }
    void setHistoryCapacity(std::size_t capacity) { m_historyCapacity = capacity; }

    /**
     * @brief Round to the grid when snapping is on; unchanged otherwise
     */
    gp_Pnt2d snapToGrid(const gp_Pnt2d& point) const;

    /**
     * @brief Give a freshly created entity the configured defaults
     */
    void applyTo(core::diagram::Wire& wire) const;
    void applyTo(core::diagram::Component& component) const;

private:
    double m_hitMargin = core::diagram::constants::DEFAULT_HIT_MARGIN;
    std::string m_wireColor = core::diagram::constants::DEFAULT_STROKE_COLOR;
    double m_wireWidth = core::diagram::constants::DEFAULT_WIRE_WIDTH;
    double m_terminalRadius = core::diagram::constants::DEFAULT_TERMINAL_RADIUS;
    double m_gridSize = 10.0;
    bool m_snapToGrid = false;
    std::size_t m_historyCapacity = 100;
};

} // namespace circuitsketch::app

#endif // CIRCUITSKETCH_APP_EDITORSETTINGS_H
