/**
 * @file Shape.h
 * @brief Base class for all editable diagram entities
 *
 * Wires and components inherit from this class. It provides identification,
 * selection state, the hit margin used by picking, and the common
 * draw / hit-test / move / edit / serialize interface.
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_SHAPE_H
#define CIRCUITSKETCH_CORE_DIAGRAM_SHAPE_H

#include "DiagramTypes.h"
#include "FieldResult.h"

#include <QJsonObject>

#include <string>

namespace circuitsketch::render {
class RenderSurface;
}

namespace circuitsketch::core::diagram {

/**
 * @brief Abstract base class for editable entities
 *
 * Provides:
 * - Unique identification via UUID (read-only after construction)
 * - Selection flag
 * - Hit margin added to geometric picking tolerance
 * - Snapshot hooks used by the editing history
 */
class Shape {
public:
    virtual ~Shape() = default;
    Shape(const Shape&) = delete;
    Shape& operator=(const Shape&) = delete;
    Shape(Shape&&) noexcept = default;
    Shape& operator=(Shape&&) noexcept = default;

    //--------------------------------------------------------------------------
    // Identification
    //--------------------------------------------------------------------------

    const EntityID& id() const { return m_id; }

    virtual EntityType type() const = 0;
    virtual std::string typeName() const = 0;

    //--------------------------------------------------------------------------
    // Selection
    //--------------------------------------------------------------------------

    bool isSelected() const { return m_isSelected; }
    void select() { m_isSelected = true; }
    void deselect() { m_isSelected = false; }
    void setSelected(bool selected) { m_isSelected = selected; }

    //--------------------------------------------------------------------------
    // Picking
    //--------------------------------------------------------------------------

    double hitMargin() const { return m_hitMargin; }

    /**
     * @brief Set the extra picking distance
     * @return Rejected for negative or non-finite values (margin unchanged)
     */
    FieldResult setHitMargin(double margin);

    //--------------------------------------------------------------------------
    // Entity Interface
    //--------------------------------------------------------------------------

    virtual void draw(render::RenderSurface& surface) const = 0;

    /**
     * @brief Check whether a surface-local point touches this entity
     *
     * Pure geometry; no render surface is consulted.
     */
    virtual bool isHit(double x, double y) const = 0;

    /**
     * @brief Translate by (dx, dy); entities may refuse (attached wires)
     */
    virtual void move(double dx, double dy) = 0;

    /**
     * @brief Apply a partial property update
     *
     * Only whitelisted keys are considered; unknown keys are ignored. Each
     * value goes through its validated setter.
     */
    virtual EditResult edit(const QJsonObject& properties) = 0;

    virtual QJsonObject toJson() const = 0;

    /**
     * @brief Restore editable state from a history snapshot
     *
     * Snapshots are toJson() output. The identity fields are ignored.
     */
    virtual EditResult applySnapshot(const QJsonObject& snapshot) { return edit(snapshot); }

protected:
    Shape();
    explicit Shape(const EntityID& id);

    /**
     * @brief Fields every entity record carries: id and type
     */
    QJsonObject baseJson() const;

    static EntityID generateId();

private:
    EntityID m_id;
    bool m_isSelected = false;
    double m_hitMargin = constants::DEFAULT_HIT_MARGIN;
};

} // namespace circuitsketch::core::diagram

#endif // CIRCUITSKETCH_CORE_DIAGRAM_SHAPE_H
