/**
 * @file EntityHistory.cpp
 */
#include "EntityHistory.h"

#include "../../core/diagram/Shape.h"

#include <QLoggingCategory>

namespace circuitsketch::app::history {

Q_LOGGING_CATEGORY(logHistory, "circuitsketch.app.history")

namespace {

QString qId(const core::diagram::EntityID& id) {
    return QString::fromStdString(id);
}

void logRejected(const core::diagram::EntityID& id, const core::diagram::EditResult& result) {
    for (const auto& rejected : result.rejected) {
        qCWarning(logHistory) << "snapshot field" << QString::fromStdString(rejected.field)
                              << "not restored on" << qId(id) << "-"
                              << QString::fromStdString(rejected.reason);
    }
}

} // namespace

EntityHistory::EntityHistory(QObject* parent)
    : QObject(parent) {
}

EntityHistory::EntityHistory(std::size_t capacity, QObject* parent)
    : QObject(parent),
      store_(capacity) {
}

void EntityHistory::track(const core::diagram::Shape& shape) {
    store_.initialize(shape.id(), shape.toJson());
}

void EntityHistory::commit(const core::diagram::Shape& shape) {
    const auto& id = shape.id();
    if (!store_.contains(id)) {
        track(shape);
        return;
    }

    const bool prevUndo = canUndo(id);
    const bool prevRedo = canRedo(id);
    store_.push(id, shape.toJson());
    qCDebug(logHistory) << "commit" << qId(id) << "step" << store_.cursor(id);
    emitStateChange(id, prevUndo, prevRedo);
}

bool EntityHistory::undo(core::diagram::Shape& shape) {
    const auto& id = shape.id();
    if (!canUndo(id)) {
        return false;
    }

    const bool prevRedo = canRedo(id);
    logRejected(id, shape.applySnapshot(store_.undo(id)));
    emitStateChange(id, true, prevRedo);
    return true;
}

bool EntityHistory::redo(core::diagram::Shape& shape) {
    const auto& id = shape.id();
    if (!canRedo(id)) {
        return false;
    }

    const bool prevUndo = canUndo(id);
    logRejected(id, shape.applySnapshot(store_.redo(id)));
    emitStateChange(id, prevUndo, true);
    return true;
}

bool EntityHistory::restore(core::diagram::Shape& shape, std::size_t index) {
    const auto& id = shape.id();
    if (!store_.contains(id)) {
        qCWarning(logHistory) << "restore on untracked entity" << qId(id);
        return false;
    }
    if (index >= store_.size(id)) {
        qCWarning(logHistory) << "restore index" << index << "out of range for" << qId(id);
        return false;
    }

    const bool prevUndo = canUndo(id);
    const bool prevRedo = canRedo(id);
    logRejected(id, shape.applySnapshot(store_.restore(id, index)));
    emitStateChange(id, prevUndo, prevRedo);
    return true;
}

void EntityHistory::discardLatest(const core::diagram::Shape& shape) {
    const auto& id = shape.id();
    if (!store_.contains(id)) {
        return;
    }

    const bool prevUndo = canUndo(id);
    const bool prevRedo = canRedo(id);
    store_.popLatest(id);
    emitStateChange(id, prevUndo, prevRedo);
}

void EntityHistory::forget(const core::diagram::EntityID& id) {
    if (!store_.contains(id)) {
        return;
    }

    const bool prevUndo = canUndo(id);
    const bool prevRedo = canRedo(id);
    store_.clear(id);
    emitStateChange(id, prevUndo, prevRedo);
}

void EntityHistory::reset() {
    for (const auto& id : store_.keys()) {
        forget(id);
    }
}

bool EntityHistory::isTracked(const core::diagram::EntityID& id) const {
    return store_.contains(id);
}

bool EntityHistory::canUndo(const core::diagram::EntityID& id) const {
    return store_.canUndo(id);
}

bool EntityHistory::canRedo(const core::diagram::EntityID& id) const {
    return store_.canRedo(id);
}

void EntityHistory::emitStateChange(const core::diagram::EntityID& id, bool prevUndo, bool prevRedo) {
    const bool nowUndo = canUndo(id);
    const bool nowRedo = canRedo(id);
    if (prevUndo != nowUndo) {
        emit canUndoChanged(qId(id), nowUndo);
    }
    if (prevRedo != nowRedo) {
        emit canRedoChanged(qId(id), nowRedo);
    }
}

} // namespace circuitsketch::app::history
