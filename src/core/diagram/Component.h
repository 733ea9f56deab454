/**
 * @file Component.h
 * @brief Placed part that owns connection terminals
 *
 * Only the parts of a component that wiring depends on are modeled here:
 * placement, size, rotation/flip and the terminals. The visual body is a
 * plain outline; richer bodies are drawn by the application layer.
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_COMPONENT_H
#define CIRCUITSKETCH_CORE_DIAGRAM_COMPONENT_H

#include "Shape.h"
#include "Terminal.h"

#include <QJsonValue>
#include <gp_Pnt2d.hxx>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace circuitsketch::core::diagram {

/**
 * @brief Rectangular component with terminals
 *
 * The component is the sole strong owner of its terminals. Wires observe
 * them through weak references, so removing a component never waits on the
 * wires attached to it.
 */
class Component : public Shape {
public:
    Component(double x, double y, double width, double height);
    Component(const EntityID& id, double x, double y, double width, double height);
    ~Component() override;

    // Terminals keep a back pointer to this object
    Component(Component&&) = delete;
    Component& operator=(Component&&) = delete;

    //--------------------------------------------------------------------------
    // Placement
    //--------------------------------------------------------------------------

    double positionX() const { return m_positionX; }
    double positionY() const { return m_positionY; }
    FieldResult setPosition(double x, double y);

    double width() const { return m_width; }
    FieldResult setWidth(double width);

    double height() const { return m_height; }
    FieldResult setHeight(double height);

    gp_Pnt2d center() const;

    /**
     * @brief Rotation in degrees, always within [0, 360)
     */
    double rotation() const { return m_rotation; }
    FieldResult setRotation(double degrees);

    bool flipH() const { return m_flipH; }
    void setFlipH(bool flip) { m_flipH = flip; }

    bool flipV() const { return m_flipV; }
    void setFlipV(bool flip) { m_flipV = flip; }

    /**
     * @brief Whether terminal positions follow rotation and flips
     */
    bool terminalsFollowTransform() const { return m_terminalsFollowTransform; }
    void setTerminalsFollowTransform(bool follow) { m_terminalsFollowTransform = follow; }

    /**
     * @brief Text drawn at the body center; empty draws nothing
     */
    const std::string& label() const { return m_label; }
    void setLabel(std::string label) { m_label = std::move(label); }

    //--------------------------------------------------------------------------
    // Terminals
    //--------------------------------------------------------------------------

    /**
     * @brief Create a terminal at (x, y) relative to the top-left corner
     * @return The new terminal, or nullptr if @p id is empty or already used
     */
    std::shared_ptr<Terminal> addTerminal(const TerminalID& id, double x, double y);

    /**
     * @brief Find a terminal by id
     */
    std::shared_ptr<Terminal> terminal(const TerminalID& id) const;

    const std::vector<std::shared_ptr<Terminal>>& terminals() const { return m_terminals; }

    /**
     * @brief Terminal under (x, y), nullptr if none
     */
    std::shared_ptr<Terminal> terminalAt(double x, double y) const;

    //--------------------------------------------------------------------------
    // Shape Interface
    //--------------------------------------------------------------------------

    EntityType type() const override { return EntityType::Component; }
    std::string typeName() const override { return "Component"; }

    void draw(render::RenderSurface& surface) const override;

    /**
     * @brief Bounding box test in the component's own (unrotated, unflipped) frame
     */
    bool isHit(double x, double y) const override;

    void move(double dx, double dy) override;
    EditResult edit(const QJsonObject& properties) override;
    QJsonObject toJson() const override;

    /**
     * @brief Restore placement and transform from a toJson() record
     */
    EditResult applySnapshot(const QJsonObject& snapshot) override;

    /**
     * @brief Rebuild a component and its terminals
     * @throws std::invalid_argument if @p json is not an object
     */
    static std::unique_ptr<Component> fromJson(const QJsonValue& json);

private:
    double m_positionX = 0.0;
    double m_positionY = 0.0;
    double m_width = 0.0;
    double m_height = 0.0;
    double m_rotation = 0.0;
    bool m_flipH = false;
    bool m_flipV = false;
    bool m_terminalsFollowTransform = false;
    std::string m_strokeColor = constants::DEFAULT_STROKE_COLOR;
    std::string m_label;
    std::vector<std::shared_ptr<Terminal>> m_terminals;
};

} // namespace circuitsketch::core::diagram

#endif // CIRCUITSKETCH_CORE_DIAGRAM_COMPONENT_H
