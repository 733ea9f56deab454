#include "Terminal.h"

#include "Component.h"
#include "GeometryUtils.h"
#include "Validation.h"
#include "../../render/RenderSurface.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <utility>

namespace circuitsketch::core::diagram {

Q_LOGGING_CATEGORY(logTerminal, "circuitsketch.core.terminal")

Terminal::Terminal(TerminalID id, double x, double y, const Component* parent)
    : m_id(std::move(id)),
      m_parent(parent) {
    const FieldResult placed = setPosition(x, y);
    if (!placed) {
        qCWarning(logTerminal) << "terminal" << QString::fromStdString(m_id)
                               << "placed at origin:" << QString::fromStdString(placed.reason);
    }
}

FieldResult Terminal::setPosition(double x, double y) {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return FieldResult::rejected("position", "terminal coordinates must be finite");
    }
    m_positionX = x;
    m_positionY = y;
    return FieldResult::ok("position");
}

gp_Pnt2d Terminal::getAbsolutePosition() const {
    if (!m_parent) {
        return gp_Pnt2d(m_positionX, m_positionY);
    }

    const gp_Pnt2d local(m_parent->positionX() + m_positionX,
                         m_parent->positionY() + m_positionY);
    if (!m_parent->terminalsFollowTransform()) {
        return local;
    }

    const gp_Pnt2d center = m_parent->center();
    const double scaleX = m_parent->flipH() ? -1.0 : 1.0;
    const double scaleY = m_parent->flipV() ? -1.0 : 1.0;
    const gp_Pnt2d flipped(center.X() + (local.X() - center.X()) * scaleX,
                           center.Y() + (local.Y() - center.Y()) * scaleY);
    return geometry::rotateAbout(flipped, center, m_parent->rotation());
}

FieldResult Terminal::setRadius(double radius) {
    if (!validation::isNonNegative(radius)) {
        return FieldResult::rejected("radius", "radius must be a non-negative number");
    }
    m_radius = radius;
    return FieldResult::ok("radius");
}

FieldResult Terminal::setColor(const std::string& color) {
    if (!validation::isValidColor(color)) {
        return FieldResult::rejected("color", "unrecognized color '" + color + "'");
    }
    m_color = color;
    return FieldResult::ok("color");
}

void Terminal::addWire(const EntityID& wireId) {
    if (!isConnectedTo(wireId)) {
        m_connectedWires.push_back(wireId);
    }
}

void Terminal::removeWire(const EntityID& wireId) {
    m_connectedWires.erase(std::remove(m_connectedWires.begin(), m_connectedWires.end(), wireId),
                           m_connectedWires.end());
}

bool Terminal::isConnectedTo(const EntityID& wireId) const {
    return std::find(m_connectedWires.begin(), m_connectedWires.end(), wireId) !=
           m_connectedWires.end();
}

bool Terminal::isHit(double x, double y) const {
    const gp_Pnt2d position = getAbsolutePosition();
    const double parentMargin = m_parent ? m_parent->hitMargin() : 0.0;
    const double hitRadius = m_radius + parentMargin + constants::TERMINAL_PICK_SLACK;
    return position.SquareDistance(gp_Pnt2d(x, y)) <= hitRadius * hitRadius;
}

void Terminal::draw(render::RenderSurface& surface) const {
    const gp_Pnt2d position = getAbsolutePosition();

    render::SurfaceStateGuard guard(surface);
    surface.setFillColor(m_color);
    surface.setStrokeColor(constants::DEFAULT_STROKE_COLOR);
    surface.setStrokeWidth(1.0);
    surface.beginPath();
    surface.circle(position.X(), position.Y(), m_radius);
    surface.fill();
    surface.stroke();
}

QJsonObject Terminal::toJson() const {
    QJsonObject json;
    json["id"] = QString::fromStdString(m_id);
    json["x"] = m_positionX;
    json["y"] = m_positionY;
    return json;
}

std::shared_ptr<Terminal> Terminal::fromJson(const QJsonObject& json, const Component* parent) {
    const QString id = json.value("id").toString();
    if (id.isEmpty()) {
        return nullptr;
    }
    const double x = validation::numberFrom(json.value("x")).value_or(0.0);
    const double y = validation::numberFrom(json.value("y")).value_or(0.0);
    return std::make_shared<Terminal>(id.toStdString(), x, y, parent);
}

} // namespace circuitsketch::core::diagram
