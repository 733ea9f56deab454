#include "Component.h"

#include "GeometryUtils.h"
#include "Validation.h"
#include "../../render/RenderSurface.h"

#include <QJsonArray>
#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace circuitsketch::core::diagram {

Q_LOGGING_CATEGORY(logComponent, "circuitsketch.core.component")

namespace {

void warnRejected(const EntityID& id, const FieldResult& result) {
    qCWarning(logComponent) << "component" << QString::fromStdString(id)
                            << "rejected" << QString::fromStdString(result.field)
                            << "-" << QString::fromStdString(result.reason);
}

template <typename Setter>
FieldResult flagFrom(const QJsonObject& properties, const char* key, Setter&& setter) {
    const QJsonValue value = properties.value(QString::fromLatin1(key));
    if (!value.isBool()) {
        return FieldResult::rejected(key, std::string(key) + " must be a boolean");
    }
    setter(value.toBool());
    return FieldResult::ok(key);
}

} // namespace

Component::Component(double x, double y, double width, double height)
    : Component(EntityID{}, x, y, width, height) {
}

Component::Component(const EntityID& id, double x, double y, double width, double height)
    : Shape(id) {
    for (const FieldResult& result : {setPosition(x, y), setWidth(width), setHeight(height)}) {
        if (!result) {
            warnRejected(this->id(), result);
        }
    }
}

Component::~Component() {
    // Terminals may outlive us through a shared_ptr held elsewhere
    for (const auto& terminal : m_terminals) {
        terminal->setParentComponent(nullptr);
    }
}

FieldResult Component::setPosition(double x, double y) {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return FieldResult::rejected("position", "position must be finite");
    }
    m_positionX = x;
    m_positionY = y;
    return FieldResult::ok("position");
}

FieldResult Component::setWidth(double width) {
    if (!validation::isNonNegative(width)) {
        return FieldResult::rejected("width", "width must be a non-negative number");
    }
    m_width = width;
    return FieldResult::ok("width");
}

FieldResult Component::setHeight(double height) {
    if (!validation::isNonNegative(height)) {
        return FieldResult::rejected("height", "height must be a non-negative number");
    }
    m_height = height;
    return FieldResult::ok("height");
}

gp_Pnt2d Component::center() const {
    return gp_Pnt2d(m_positionX + m_width / 2.0, m_positionY + m_height / 2.0);
}

FieldResult Component::setRotation(double degrees) {
    if (!std::isfinite(degrees)) {
        return FieldResult::rejected("rotation", "rotation must be a finite number");
    }
    m_rotation = geometry::normalizeDegrees(degrees);
    return FieldResult::ok("rotation");
}

std::shared_ptr<Terminal> Component::addTerminal(const TerminalID& id, double x, double y) {
    if (id.empty() || terminal(id)) {
        qCWarning(logComponent) << "addTerminal rejected id" << QString::fromStdString(id)
                                << "on component" << QString::fromStdString(this->id());
        return nullptr;
    }
    auto created = std::make_shared<Terminal>(id, x, y, this);
    m_terminals.push_back(created);
    return created;
}

std::shared_ptr<Terminal> Component::terminal(const TerminalID& id) const {
    auto it = std::find_if(m_terminals.begin(), m_terminals.end(),
                           [&id](const std::shared_ptr<Terminal>& candidate) {
                               return candidate->id() == id;
                           });
    return it != m_terminals.end() ? *it : nullptr;
}

std::shared_ptr<Terminal> Component::terminalAt(double x, double y) const {
    for (const auto& candidate : m_terminals) {
        if (candidate->isHit(x, y)) {
            return candidate;
        }
    }
    return nullptr;
}

void Component::draw(render::RenderSurface& surface) const {
    const gp_Pnt2d pivot = center();
    const double halfW = m_width / 2.0;
    const double halfH = m_height / 2.0;
    const double sx = m_flipH ? -1.0 : 1.0;
    const double sy = m_flipV ? -1.0 : 1.0;

    // Body corners in the local frame, then flipped and rotated into place
    const gp_Pnt2d corners[] = {
        gp_Pnt2d(pivot.X() - halfW * sx, pivot.Y() - halfH * sy),
        gp_Pnt2d(pivot.X() + halfW * sx, pivot.Y() - halfH * sy),
        gp_Pnt2d(pivot.X() + halfW * sx, pivot.Y() + halfH * sy),
        gp_Pnt2d(pivot.X() - halfW * sx, pivot.Y() + halfH * sy),
    };

    {
        render::SurfaceStateGuard guard(surface);
        surface.setStrokeColor(m_strokeColor);
        surface.setStrokeWidth(isSelected() ? 2.0 : 1.0);
        surface.setStrokeJoin(render::LineJoin::Miter);
        surface.beginPath();
        bool first = true;
        for (const gp_Pnt2d& corner : corners) {
            const gp_Pnt2d placed = geometry::rotateAbout(corner, pivot, m_rotation);
            if (first) {
                surface.moveTo(placed.X(), placed.Y());
                first = false;
            } else {
                surface.lineTo(placed.X(), placed.Y());
            }
        }
        surface.closePath();
        surface.stroke();
    }

    if (!m_label.empty()) {
        render::SurfaceStateGuard guard(surface);
        surface.setFillColor(m_strokeColor);
        surface.fillText(m_label, pivot.X(), pivot.Y());
    }

    for (const auto& item : m_terminals) {
        item->draw(surface);
    }
}

bool Component::isHit(double x, double y) const {
    const gp_Pnt2d pivot = center();

    // Undo rotation, then flips, to land in the unrotated component frame
    const gp_Pnt2d unrotated = geometry::rotateAbout(gp_Pnt2d(x, y), pivot, -m_rotation);
    const double scaleX = m_flipH ? -1.0 : 1.0;
    const double scaleY = m_flipV ? -1.0 : 1.0;
    const double localX = pivot.X() + (unrotated.X() - pivot.X()) / scaleX;
    const double localY = pivot.Y() + (unrotated.Y() - pivot.Y()) / scaleY;

    const double margin = hitMargin();
    return localX >= m_positionX - margin && localX <= m_positionX + m_width + margin &&
           localY >= m_positionY - margin && localY <= m_positionY + m_height + margin;
}

void Component::move(double dx, double dy) {
    if (!std::isfinite(dx) || !std::isfinite(dy)) {
        qCWarning(logComponent) << "move ignored non-finite delta" << dx << dy;
        return;
    }
    m_positionX += dx;
    m_positionY += dy;
}

EditResult Component::edit(const QJsonObject& properties) {
    EditResult result;

    if (properties.contains("positionX") || properties.contains("positionY")) {
        auto x = properties.contains("positionX")
                     ? validation::numberFrom(properties.value("positionX"))
                     : std::optional<double>(m_positionX);
        auto y = properties.contains("positionY")
                     ? validation::numberFrom(properties.value("positionY"))
                     : std::optional<double>(m_positionY);
        result.add(x && y ? setPosition(*x, *y)
                          : FieldResult::rejected("position", "position must be numeric"));
    }
    if (properties.contains("width")) {
        auto width = validation::numberFrom(properties.value("width"));
        result.add(width ? setWidth(*width) : FieldResult::rejected("width", "width must be numeric"));
    }
    if (properties.contains("height")) {
        auto height = validation::numberFrom(properties.value("height"));
        result.add(height ? setHeight(*height)
                          : FieldResult::rejected("height", "height must be numeric"));
    }
    if (properties.contains("rotation")) {
        auto rotation = validation::numberFrom(properties.value("rotation"));
        result.add(rotation ? setRotation(*rotation)
                            : FieldResult::rejected("rotation", "rotation must be numeric"));
    }
    if (properties.contains("flipH")) {
        result.add(flagFrom(properties, "flipH", [this](bool flip) { setFlipH(flip); }));
    }
    if (properties.contains("flipV")) {
        result.add(flagFrom(properties, "flipV", [this](bool flip) { setFlipV(flip); }));
    }
    if (properties.contains("terminalsFollowTransform")) {
        result.add(flagFrom(properties, "terminalsFollowTransform",
                            [this](bool follow) { setTerminalsFollowTransform(follow); }));
    }
    if (properties.contains("label")) {
        const QJsonValue value = properties.value("label");
        if (value.isString()) {
            setLabel(value.toString().toStdString());
            result.add(FieldResult::ok("label"));
        } else {
            result.add(FieldResult::rejected("label", "label must be a string"));
        }
    }

    for (const FieldResult& rejected : result.rejected) {
        warnRejected(id(), rejected);
    }
    return result;
}

QJsonObject Component::toJson() const {
    QJsonObject json = baseJson();
    json["x"] = m_positionX;
    json["y"] = m_positionY;
    json["width"] = m_width;
    json["height"] = m_height;
    json["rotation"] = m_rotation;
    json["flipH"] = m_flipH;
    json["flipV"] = m_flipV;
    json["terminalsFollowTransform"] = m_terminalsFollowTransform;
    json["label"] = QString::fromStdString(m_label);

    QJsonArray terminals;
    for (const auto& item : m_terminals) {
        terminals.append(item->toJson());
    }
    json["terminals"] = terminals;
    return json;
}

EditResult Component::applySnapshot(const QJsonObject& snapshot) {
    QJsonObject properties;
    if (snapshot.contains("x")) {
        properties["positionX"] = snapshot.value("x");
    }
    if (snapshot.contains("y")) {
        properties["positionY"] = snapshot.value("y");
    }
    for (const char* key : {"width", "height", "rotation", "flipH", "flipV", "terminalsFollowTransform", "label"}) {
        if (snapshot.contains(key)) {
            properties[key] = snapshot.value(key);
        }
    }
    return edit(properties);
}

std::unique_ptr<Component> Component::fromJson(const QJsonValue& json) {
    if (!json.isObject()) {
        throw std::invalid_argument("Component::fromJson expects a JSON object");
    }
    const QJsonObject object = json.toObject();

    auto component = std::make_unique<Component>(
        object.value("id").toString().toStdString(),
        validation::numberFrom(object.value("x")).value_or(0.0),
        validation::numberFrom(object.value("y")).value_or(0.0),
        validation::numberFrom(object.value("width")).value_or(0.0),
        validation::numberFrom(object.value("height")).value_or(0.0));

    QJsonObject transform;
    for (const char* key : {"rotation", "flipH", "flipV", "terminalsFollowTransform", "label"}) {
        if (object.contains(key)) {
            transform[key] = object.value(key);
        }
    }
    component->edit(transform);

    for (const QJsonValue& entry : object.value("terminals").toArray()) {
        auto terminal = Terminal::fromJson(entry.toObject(), component.get());
        if (!terminal || component->terminal(terminal->id())) {
            qCWarning(logComponent) << "skipping invalid or duplicate terminal record on component"
                                    << QString::fromStdString(component->id());
            continue;
        }
        component->m_terminals.push_back(std::move(terminal));
    }
    return component;
}

} // namespace circuitsketch::core::diagram
