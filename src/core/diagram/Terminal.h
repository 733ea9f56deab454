/**
 * @file Terminal.h
 * @brief Connection anchor owned by a component
 *
 * Terminals are the points wires attach to. A terminal stores its position
 * relative to the owning component; the absolute position is derived on
 * demand so wires follow the component when it moves, rotates or flips.
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_TERMINAL_H
#define CIRCUITSKETCH_CORE_DIAGRAM_TERMINAL_H

#include "DiagramTypes.h"
#include "FieldResult.h"

#include <QJsonObject>
#include <gp_Pnt2d.hxx>

#include <memory>
#include <string>
#include <vector>

namespace circuitsketch::render {
class RenderSurface;
}

namespace circuitsketch::core::diagram {

/**
 * @brief Anchor point on a component
 *
 * The parent pointer is non-owning; the component owns the terminal.
 * connectedWires holds the ids of wires attached here so that deleting a
 * wire or a component can clean up both sides of the relation.
 */
class Terminal {
public:
    Terminal(TerminalID id, double x, double y, const Component* parent = nullptr);

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    const TerminalID& id() const { return m_id; }

    //--------------------------------------------------------------------------
    // Position
    //--------------------------------------------------------------------------

    double positionX() const { return m_positionX; }
    double positionY() const { return m_positionY; }

    /**
     * @brief Set the position relative to the parent's top-left corner
     * @return Rejected for non-finite coordinates (position unchanged)
     */
    FieldResult setPosition(double x, double y);

    /**
     * @brief Position on the drawing surface
     *
     * Without a parent the local position is returned as is. With a parent
     * the parent origin is added, and when the parent has
     * terminalsFollowTransform set the point is flipped and rotated about the
     * parent's center the same way the component body is.
     */
    gp_Pnt2d getAbsolutePosition() const;

    const Component* parentComponent() const { return m_parent; }
    void setParentComponent(const Component* parent) { m_parent = parent; }

    //--------------------------------------------------------------------------
    // Appearance
    //--------------------------------------------------------------------------

    double radius() const { return m_radius; }
    FieldResult setRadius(double radius);

    const std::string& color() const { return m_color; }
    FieldResult setColor(const std::string& color);

    //--------------------------------------------------------------------------
    // Connectivity
    //--------------------------------------------------------------------------

    const std::vector<EntityID>& connectedWires() const { return m_connectedWires; }

    /**
     * @brief Record a wire attached to this terminal (no duplicates)
     */
    void addWire(const EntityID& wireId);

    /**
     * @brief Forget a wire; no-op if it is not recorded
     */
    void removeWire(const EntityID& wireId);

    bool isConnectedTo(const EntityID& wireId) const;

    //--------------------------------------------------------------------------
    // Picking / Drawing / Serialization
    //--------------------------------------------------------------------------

    /**
     * @brief Hit radius is radius + parent hit margin + a small slack
     */
    bool isHit(double x, double y) const;

    void draw(render::RenderSurface& surface) const;

    QJsonObject toJson() const;

    /**
     * @brief Rebuild from {id, x, y}; missing coordinates default to 0
     * @return nullptr if @p json has no id
     */
    static std::shared_ptr<Terminal> fromJson(const QJsonObject& json, const Component* parent);

private:
    TerminalID m_id;
    double m_positionX = 0.0;
    double m_positionY = 0.0;
    const Component* m_parent = nullptr;
    double m_radius = constants::DEFAULT_TERMINAL_RADIUS;
    std::string m_color = constants::DEFAULT_TERMINAL_COLOR;
    std::vector<EntityID> m_connectedWires;
};

} // namespace circuitsketch::core::diagram

#endif // CIRCUITSKETCH_CORE_DIAGRAM_TERMINAL_H
