/**
 * @file EntityHistory.h
 * @brief Per-entity undo/redo for the editing session
 */
#ifndef CIRCUITSKETCH_APP_HISTORY_ENTITYHISTORY_H
#define CIRCUITSKETCH_APP_HISTORY_ENTITYHISTORY_H

#include "HistoryStore.h"
#include "../../core/diagram/DiagramTypes.h"

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <cstddef>

namespace circuitsketch::core::diagram {
class Shape;
}

namespace circuitsketch::app::history {

/**
 * @brief Snapshot history keyed by entity id
 *
 * Snapshots are the entity's toJson() record. Undo, redo and restore write
 * the selected snapshot back through Shape::applySnapshot.
 */
class EntityHistory : public QObject {
    Q_OBJECT

public:
    using Store = HistoryStore<core::diagram::EntityID, QJsonObject>;

    explicit EntityHistory(QObject* parent = nullptr);
    explicit EntityHistory(std::size_t capacity, QObject* parent = nullptr);

    /**
     * @brief Start tracking with the current state; no-op if already tracked
     */
    void track(const core::diagram::Shape& shape);

    /**
     * @brief Record the current state as a new step
     *
     * An untracked shape is tracked instead, so the first commit of a fresh
     * entity becomes its base state.
     */
    void commit(const core::diagram::Shape& shape);

    bool undo(core::diagram::Shape& shape);
    bool redo(core::diagram::Shape& shape);

    /**
     * @brief Jump to a recorded state
     * @return false if the shape is untracked or @p index is out of range
     */
    bool restore(core::diagram::Shape& shape, std::size_t index);

    /**
     * @brief Drop the newest recorded state (abandoned gesture)
     */
    void discardLatest(const core::diagram::Shape& shape);

    void forget(const core::diagram::EntityID& id);
    void reset();

    bool isTracked(const core::diagram::EntityID& id) const;
    bool canUndo(const core::diagram::EntityID& id) const;
    bool canRedo(const core::diagram::EntityID& id) const;

    const Store& store() const { return store_; }

signals:
    void canUndoChanged(const QString& entityId, bool canUndo);
    void canRedoChanged(const QString& entityId, bool canRedo);

private:
    void emitStateChange(const core::diagram::EntityID& id, bool prevUndo, bool prevRedo);

    Store store_;
};

} // namespace circuitsketch::app::history

#endif // CIRCUITSKETCH_APP_HISTORY_ENTITYHISTORY_H
