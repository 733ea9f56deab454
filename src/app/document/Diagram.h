/**
 * @file Diagram.h
 * @brief Document owning every component and wire of a drawing
 */
#ifndef CIRCUITSKETCH_APP_DOCUMENT_DIAGRAM_H
#define CIRCUITSKETCH_APP_DOCUMENT_DIAGRAM_H

#include "../../core/diagram/Component.h"
#include "../../core/diagram/Wire.h"

#include <QObject>
#include <QString>

#include <memory>
#include <unordered_map>
#include <vector>

namespace circuitsketch::render {
class RenderSurface;
}

namespace circuitsketch::app {

/**
 * @brief Entity arena with an id index
 *
 * Entities are kept in insertion order, which is also the drawing order.
 * The diagram is the party that keeps wire/terminal relations consistent:
 * it records wires on terminals when connecting, and removes those records
 * when a wire or a component goes away.
 */
class Diagram : public QObject {
    Q_OBJECT

public:
    explicit Diagram(QObject* parent = nullptr);
    ~Diagram() override;

    Diagram(const Diagram&) = delete;
    Diagram& operator=(const Diagram&) = delete;

    //--------------------------------------------------------------------------
    // Entities
    //--------------------------------------------------------------------------

    /**
     * @return The component id, or empty if @p component is null or its id is taken
     */
    core::diagram::EntityID addComponent(std::unique_ptr<core::diagram::Component> component);

    /**
     * @brief Take ownership of a wire and record it on its live terminals
     * @return The wire id, or empty if @p wire is null or its id is taken
     */
    core::diagram::EntityID addWire(std::unique_ptr<core::diagram::Wire> wire);

    core::diagram::Shape* entity(const core::diagram::EntityID& id);
    const core::diagram::Shape* entity(const core::diagram::EntityID& id) const;

    core::diagram::Component* component(const core::diagram::EntityID& id);
    const core::diagram::Component* component(const core::diagram::EntityID& id) const;

    core::diagram::Wire* wire(const core::diagram::EntityID& id);
    const core::diagram::Wire* wire(const core::diagram::EntityID& id) const;

    std::vector<core::diagram::Component*> components() const;
    std::vector<core::diagram::Wire*> wires() const;

    size_t entityCount() const { return entities_.size(); }
    bool isEmpty() const { return entities_.empty(); }

    //--------------------------------------------------------------------------
    // Terminals and connectivity
    //--------------------------------------------------------------------------

    std::shared_ptr<core::diagram::Terminal> findTerminal(const core::diagram::TerminalID& id) const;

    /**
     * @brief id -> terminal table over every component
     */
    core::diagram::TerminalMap terminalMap() const;

    /**
     * @brief Attach a wire to terminals, updating both sides
     *
     * An empty terminal id detaches that end.
     * @return false (nothing changed) if the wire or a named terminal is unknown
     */
    bool connectWire(const core::diagram::EntityID& wireId,
                     const core::diagram::TerminalID& startTerminalId,
                     const core::diagram::TerminalID& endTerminalId);

    /**
     * @brief Record a wire on the terminals it currently references
     */
    void registerWireOnTerminals(const core::diagram::Wire& wire);

    /**
     * @brief Delete a wire and drop it from its terminals
     */
    bool removeWire(const core::diagram::EntityID& id);

    /**
     * @brief Delete a component; wires attached to it are detached, not deleted
     */
    bool removeComponent(const core::diagram::EntityID& id);

    /**
     * @brief Delete any wire still flagged temporary (abandoned gesture)
     * @return Number of wires removed
     */
    size_t removeTemporaryWires();

    /**
     * @brief Wires with a terminal id that no longer resolves to a live terminal
     */
    std::vector<core::diagram::EntityID> danglingReferences() const;

    //--------------------------------------------------------------------------
    // Picking, selection and drawing
    //--------------------------------------------------------------------------

    /**
     * @brief Topmost entity under (x, y); wires win over components
     */
    core::diagram::Shape* hitTest(double x, double y) const;

    void clearSelection();
    std::vector<core::diagram::Shape*> selectedEntities() const;

    void draw(render::RenderSurface& surface) const;

    /**
     * @brief Remove everything
     */
    void clear();

signals:
    void entityAdded(const QString& id);
    void entityRemoved(const QString& id);

private:
    core::diagram::EntityID addEntity(std::unique_ptr<core::diagram::Shape> entity);
    void eraseEntity(const core::diagram::EntityID& id);
    void unregisterWireFromTerminals(const core::diagram::Wire& wire);
    void rebuildEntityIndex();

    std::vector<std::unique_ptr<core::diagram::Shape>> entities_;
    std::unordered_map<core::diagram::EntityID, size_t> entityIndex_;
};

} // namespace circuitsketch::app

#endif // CIRCUITSKETCH_APP_DOCUMENT_DIAGRAM_H
