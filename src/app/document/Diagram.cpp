/**
 * @file Diagram.cpp
 */
#include "Diagram.h"

#include "../../render/RenderSurface.h"

#include <QLoggingCategory>

#include <utility>

namespace circuitsketch::app {

Q_LOGGING_CATEGORY(logDiagram, "circuitsketch.app.diagram")

using core::diagram::Component;
using core::diagram::EntityID;
using core::diagram::EntityType;
using core::diagram::Shape;
using core::diagram::Terminal;
using core::diagram::TerminalID;
using core::diagram::Wire;

Diagram::Diagram(QObject* parent)
    : QObject(parent) {
}

Diagram::~Diagram() = default;

//------------------------------------------------------------------------------
// Entities
//------------------------------------------------------------------------------

EntityID Diagram::addComponent(std::unique_ptr<Component> component) {
    return addEntity(std::move(component));
}

EntityID Diagram::addWire(std::unique_ptr<Wire> wire) {
    if (!wire) {
        return {};
    }
    Wire& added = *wire;
    EntityID id = addEntity(std::move(wire));
    if (!id.empty()) {
        registerWireOnTerminals(added);
    }
    return id;
}

EntityID Diagram::addEntity(std::unique_ptr<Shape> entity) {
    if (!entity) {
        return {};
    }
    EntityID id = entity->id();
    if (entityIndex_.count(id) != 0) {
        qCWarning(logDiagram) << "duplicate entity id rejected:" << QString::fromStdString(id);
        return {};
    }

    entityIndex_[id] = entities_.size();
    entities_.push_back(std::move(entity));
    emit entityAdded(QString::fromStdString(id));
    return id;
}

Shape* Diagram::entity(const EntityID& id) {
    auto it = entityIndex_.find(id);
    if (it == entityIndex_.end() || it->second >= entities_.size()) {
        return nullptr;
    }
    return entities_[it->second].get();
}

const Shape* Diagram::entity(const EntityID& id) const {
    auto it = entityIndex_.find(id);
    if (it == entityIndex_.end() || it->second >= entities_.size()) {
        return nullptr;
    }
    return entities_[it->second].get();
}

Component* Diagram::component(const EntityID& id) {
    Shape* found = entity(id);
    return found && found->type() == EntityType::Component ? static_cast<Component*>(found) : nullptr;
}

const Component* Diagram::component(const EntityID& id) const {
    const Shape* found = entity(id);
    return found && found->type() == EntityType::Component ? static_cast<const Component*>(found)
                                                           : nullptr;
}

Wire* Diagram::wire(const EntityID& id) {
    Shape* found = entity(id);
    return found && found->type() == EntityType::Wire ? static_cast<Wire*>(found) : nullptr;
}

const Wire* Diagram::wire(const EntityID& id) const {
    const Shape* found = entity(id);
    return found && found->type() == EntityType::Wire ? static_cast<const Wire*>(found) : nullptr;
}

std::vector<Component*> Diagram::components() const {
    std::vector<Component*> results;
    for (const auto& item : entities_) {
        if (item->type() == EntityType::Component) {
            results.push_back(static_cast<Component*>(item.get()));
        }
    }
    return results;
}

std::vector<Wire*> Diagram::wires() const {
    std::vector<Wire*> results;
    for (const auto& item : entities_) {
        if (item->type() == EntityType::Wire) {
            results.push_back(static_cast<Wire*>(item.get()));
        }
    }
    return results;
}

//------------------------------------------------------------------------------
// Terminals and connectivity
//------------------------------------------------------------------------------

std::shared_ptr<Terminal> Diagram::findTerminal(const TerminalID& id) const {
    if (id.empty()) {
        return nullptr;
    }
    for (Component* item : components()) {
        if (auto found = item->terminal(id)) {
            return found;
        }
    }
    return nullptr;
}

core::diagram::TerminalMap Diagram::terminalMap() const {
    core::diagram::TerminalMap mapping;
    for (Component* item : components()) {
        for (const auto& terminal : item->terminals()) {
            auto [it, inserted] = mapping.emplace(terminal->id(), terminal);
            if (!inserted) {
                qCWarning(logDiagram) << "terminal id" << QString::fromStdString(it->first)
                                      << "used by more than one component; keeping the first";
            }
        }
    }
    return mapping;
}

bool Diagram::connectWire(const EntityID& wireId,
                          const TerminalID& startTerminalId,
                          const TerminalID& endTerminalId) {
    Wire* target = wire(wireId);
    if (!target) {
        return false;
    }

    std::shared_ptr<Terminal> start = findTerminal(startTerminalId);
    std::shared_ptr<Terminal> end = findTerminal(endTerminalId);
    if ((!startTerminalId.empty() && !start) || (!endTerminalId.empty() && !end)) {
        qCWarning(logDiagram) << "connectWire: unknown terminal for wire" << QString::fromStdString(wireId);
        return false;
    }

    unregisterWireFromTerminals(*target);
    target->setStartTerminal(start);
    target->setEndTerminal(end);
    registerWireOnTerminals(*target);
    return true;
}

void Diagram::registerWireOnTerminals(const Wire& wire) {
    if (auto start = wire.startTerminal()) {
        start->addWire(wire.id());
    }
    if (auto end = wire.endTerminal()) {
        end->addWire(wire.id());
    }
}

void Diagram::unregisterWireFromTerminals(const Wire& wire) {
    if (auto start = wire.startTerminal()) {
        start->removeWire(wire.id());
    }
    if (auto end = wire.endTerminal()) {
        end->removeWire(wire.id());
    }
}

bool Diagram::removeWire(const EntityID& id) {
    Wire* target = wire(id);
    if (!target) {
        return false;
    }
    unregisterWireFromTerminals(*target);
    eraseEntity(id);
    return true;
}

bool Diagram::removeComponent(const EntityID& id) {
    Component* target = component(id);
    if (!target) {
        return false;
    }

    for (const auto& terminal : target->terminals()) {
        for (const EntityID& wireId : terminal->connectedWires()) {
            Wire* attached = wire(wireId);
            if (!attached) {
                continue;
            }
            if (attached->startTerminal() == terminal) {
                attached->setStartTerminal(nullptr);
            }
            if (attached->endTerminal() == terminal) {
                attached->setEndTerminal(nullptr);
            }
            qCDebug(logDiagram) << "detached wire" << QString::fromStdString(wireId)
                                << "from removed component" << QString::fromStdString(id);
        }
    }

    eraseEntity(id);
    return true;
}

size_t Diagram::removeTemporaryWires() {
    std::vector<EntityID> temporary;
    for (Wire* item : wires()) {
        if (item->isTemporary()) {
            temporary.push_back(item->id());
        }
    }
    for (const EntityID& id : temporary) {
        removeWire(id);
    }
    return temporary.size();
}

std::vector<EntityID> Diagram::danglingReferences() const {
    std::vector<EntityID> dangling;
    for (Wire* item : wires()) {
        const bool startDangles = !item->startTerminalId().empty() && !item->startTerminal();
        const bool endDangles = !item->endTerminalId().empty() && !item->endTerminal();
        if (startDangles || endDangles) {
            dangling.push_back(item->id());
        }
    }
    return dangling;
}

//------------------------------------------------------------------------------
// Picking, selection and drawing
//------------------------------------------------------------------------------

Shape* Diagram::hitTest(double x, double y) const {
    for (auto it = entities_.rbegin(); it != entities_.rend(); ++it) {
        if ((*it)->type() == EntityType::Wire && (*it)->isHit(x, y)) {
            return it->get();
        }
    }
    for (auto it = entities_.rbegin(); it != entities_.rend(); ++it) {
        if ((*it)->type() == EntityType::Component && (*it)->isHit(x, y)) {
            return it->get();
        }
    }
    return nullptr;
}

void Diagram::clearSelection() {
    for (auto& item : entities_) {
        item->deselect();
    }
}

std::vector<Shape*> Diagram::selectedEntities() const {
    std::vector<Shape*> selected;
    for (const auto& item : entities_) {
        if (item->isSelected()) {
            selected.push_back(item.get());
        }
    }
    return selected;
}

void Diagram::draw(render::RenderSurface& surface) const {
    for (const auto& item : entities_) {
        item->draw(surface);
    }
}

void Diagram::clear() {
    std::vector<EntityID> ids;
    ids.reserve(entities_.size());
    for (const auto& item : entities_) {
        ids.push_back(item->id());
    }
    entities_.clear();
    entityIndex_.clear();
    for (const EntityID& id : ids) {
        emit entityRemoved(QString::fromStdString(id));
    }
}

void Diagram::eraseEntity(const EntityID& id) {
    auto it = entityIndex_.find(id);
    if (it == entityIndex_.end()) {
        return;
    }
    // Copy before the owning entity (and its id string) is destroyed
    const QString removedId = QString::fromStdString(id);
    entities_.erase(entities_.begin() + static_cast<long>(it->second));
    rebuildEntityIndex();
    emit entityRemoved(removedId);
}

void Diagram::rebuildEntityIndex() {
    entityIndex_.clear();
    for (size_t i = 0; i < entities_.size(); ++i) {
        entityIndex_[entities_[i]->id()] = i;
    }
}

} // namespace circuitsketch::app
