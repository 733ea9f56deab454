#include "Wire.h"

#include "GeometryUtils.h"
#include "Handle.h"
#include "Terminal.h"
#include "Validation.h"
#include "../../render/RenderSurface.h"

#include <QJsonArray>
#include <QLoggingCategory>
#include <QString>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace circuitsketch::core::diagram {

Q_LOGGING_CATEGORY(logWire, "circuitsketch.core.wire")

namespace {

bool isFinitePoint(const gp_Pnt2d& point) {
    return std::isfinite(point.X()) && std::isfinite(point.Y());
}

QJsonValue idOrNull(const TerminalID& id) {
    return id.empty() ? QJsonValue(QJsonValue::Null) : QJsonValue(QString::fromStdString(id));
}

TerminalID idFromJson(const QJsonValue& value) {
    return value.isString() ? value.toString().toStdString() : TerminalID{};
}

} // namespace

Wire::Wire(std::shared_ptr<Terminal> start, std::shared_ptr<Terminal> end)
    : Wire(EntityID{}, std::move(start), std::move(end)) {
}

Wire::Wire(const EntityID& id, std::shared_ptr<Terminal> start, std::shared_ptr<Terminal> end)
    : Shape(id) {
    setStartTerminal(start);
    setEndTerminal(end);
}

//------------------------------------------------------------------------------
// Terminals
//------------------------------------------------------------------------------

void Wire::setStartTerminal(const std::shared_ptr<Terminal>& terminal) {
    m_startTerminal = terminal;
    m_startTerminalId = terminal ? terminal->id() : TerminalID{};
}

void Wire::setEndTerminal(const std::shared_ptr<Terminal>& terminal) {
    m_endTerminal = terminal;
    m_endTerminalId = terminal ? terminal->id() : TerminalID{};
}

bool Wire::isAttached() const {
    return !m_startTerminal.expired() || !m_endTerminal.expired();
}

void Wire::disconnect() {
    setStartTerminal(nullptr);
    setEndTerminal(nullptr);
}

//------------------------------------------------------------------------------
// Path
//------------------------------------------------------------------------------

FieldResult Wire::setPath(std::vector<gp_Pnt2d> points) {
    for (const gp_Pnt2d& point : points) {
        if (!isFinitePoint(point)) {
            return FieldResult::rejected("path", "path points must have finite coordinates");
        }
    }
    m_path = std::move(points);
    return FieldResult::ok("path");
}

FieldResult Wire::addPoint(double x, double y) {
    return insertPoint(m_path.size(), gp_Pnt2d(x, y));
}

FieldResult Wire::insertPoint(size_t index, const gp_Pnt2d& point) {
    if (index > m_path.size()) {
        return FieldResult::rejected("path", "insert index out of range");
    }
    if (!isFinitePoint(point)) {
        return FieldResult::rejected("path", "path points must have finite coordinates");
    }
    m_path.insert(m_path.begin() + static_cast<std::ptrdiff_t>(index), point);
    return FieldResult::ok("path");
}

FieldResult Wire::setPoint(size_t index, const gp_Pnt2d& point) {
    if (index >= m_path.size()) {
        return FieldResult::rejected("path", "point index out of range");
    }
    if (!isFinitePoint(point)) {
        return FieldResult::rejected("path", "path points must have finite coordinates");
    }
    m_path[index] = point;
    return FieldResult::ok("path");
}

bool Wire::removePoint(size_t index) {
    if (index >= m_path.size()) {
        return false;
    }
    m_path.erase(m_path.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

std::vector<gp_Pnt2d> Wire::getAllPoints() const {
    std::vector<gp_Pnt2d> points;
    points.reserve(m_path.size() + 2);

    if (auto start = startTerminal()) {
        points.push_back(start->getAbsolutePosition());
    }
    points.insert(points.end(), m_path.begin(), m_path.end());
    if (auto end = endTerminal()) {
        points.push_back(end->getAbsolutePosition());
    }
    return points;
}

//------------------------------------------------------------------------------
// Style
//------------------------------------------------------------------------------

FieldResult Wire::setColor(const std::string& color) {
    if (!validation::isValidColor(color)) {
        return FieldResult::rejected("color", "unrecognized color '" + color + "'");
    }
    m_color = color;
    return FieldResult::ok("color");
}

FieldResult Wire::setLineWidth(double width) {
    if (!validation::isNonNegative(width)) {
        return FieldResult::rejected("lineWidth", "line width must be a non-negative number");
    }
    m_lineWidth = width;
    return FieldResult::ok("lineWidth");
}

FieldResult Wire::setLineDash(std::vector<double> pattern) {
    for (double length : pattern) {
        if (!validation::isNonNegative(length)) {
            return FieldResult::rejected("lineDash", "dash lengths must be non-negative numbers");
        }
    }
    m_lineDash = std::move(pattern);
    return FieldResult::ok("lineDash");
}

double Wire::hitTolerance() const {
    return m_lineWidth / 2.0 + hitMargin();
}

//------------------------------------------------------------------------------
// Shape Interface
//------------------------------------------------------------------------------

void Wire::draw(render::RenderSurface& surface) const {
    const std::vector<gp_Pnt2d> points = getAllPoints();
    if (points.size() < 2) {
        return;
    }

    {
        render::SurfaceStateGuard guard(surface);
        surface.setStrokeColor(m_color);
        surface.setStrokeWidth(m_lineWidth);
        surface.setStrokeDash(m_lineDash);
        surface.setStrokeCap(render::LineCap::Round);
        surface.setStrokeJoin(render::LineJoin::Round);

        surface.beginPath();
        surface.moveTo(points.front().X(), points.front().Y());
        for (size_t i = 1; i < points.size(); ++i) {
            surface.lineTo(points[i].X(), points[i].Y());
        }
        surface.stroke();
    }

    if (!isSelected()) {
        return;
    }

    for (const gp_Pnt2d& node : m_path) {
        Handle(node, HandleType::Dot).draw(surface);
    }
    for (const auto& terminal : {startTerminal(), endTerminal()}) {
        if (terminal) {
            Handle(terminal->getAbsolutePosition(), HandleType::Square).draw(surface);
        }
    }
}

bool Wire::isHit(double x, double y) const {
    return hitSegment(x, y) >= 0;
}

int Wire::hitSegment(double x, double y) const {
    return geometry::findHitSegment(getAllPoints(), gp_Pnt2d(x, y), hitTolerance());
}

void Wire::move(double dx, double dy) {
    if (isAttached()) {
        return;
    }
    if (!std::isfinite(dx) || !std::isfinite(dy)) {
        qCWarning(logWire) << "move ignored non-finite delta" << dx << dy;
        return;
    }
    for (gp_Pnt2d& point : m_path) {
        point.SetCoord(point.X() + dx, point.Y() + dy);
    }
}

EditResult Wire::edit(const QJsonObject& properties) {
    EditResult result;

    if (properties.contains("color")) {
        const QJsonValue value = properties.value("color");
        result.add(value.isString() ? setColor(value.toString().toStdString())
                                    : FieldResult::rejected("color", "color must be a string"));
    }
    if (properties.contains("lineWidth")) {
        auto width = validation::numberFrom(properties.value("lineWidth"));
        result.add(width ? setLineWidth(*width)
                         : FieldResult::rejected("lineWidth", "line width must be numeric"));
    }
    if (properties.contains("lineDash")) {
        auto pattern = validation::dashPatternFrom(properties.value("lineDash"));
        result.add(pattern ? setLineDash(std::move(*pattern))
                           : FieldResult::rejected("lineDash",
                                                   "line dash must be an array of non-negative numbers"));
    }
    if (properties.contains("isTemporary")) {
        const QJsonValue value = properties.value("isTemporary");
        if (value.isBool()) {
            setTemporary(value.toBool());
            result.add(FieldResult::ok("isTemporary"));
        } else {
            result.add(FieldResult::rejected("isTemporary", "isTemporary must be a boolean"));
        }
    }
    if (properties.contains("path")) {
        auto points = validation::pointListFrom(properties.value("path"));
        result.add(points ? setPath(std::move(*points))
                          : FieldResult::rejected("path", "path must be an array of {x, y} points"));
    }

    for (const FieldResult& rejected : result.rejected) {
        qCWarning(logWire) << "wire" << QString::fromStdString(id())
                           << "kept previous" << QString::fromStdString(rejected.field)
                           << "-" << QString::fromStdString(rejected.reason);
    }
    return result;
}

QJsonObject Wire::toJson() const {
    QJsonObject json = baseJson();
    json["startTerminalId"] = idOrNull(m_startTerminalId);
    json["endTerminalId"] = idOrNull(m_endTerminalId);

    QJsonArray path;
    for (const gp_Pnt2d& point : m_path) {
        QJsonObject entry;
        entry["x"] = point.X();
        entry["y"] = point.Y();
        path.append(entry);
    }
    json["path"] = path;

    json["color"] = QString::fromStdString(m_color);
    json["lineWidth"] = m_lineWidth;

    QJsonArray dash;
    for (double length : m_lineDash) {
        dash.append(length);
    }
    json["lineDash"] = dash;
    return json;
}

std::unique_ptr<Wire> Wire::fromJson(const QJsonValue& json,
                                     std::shared_ptr<Terminal> start,
                                     std::shared_ptr<Terminal> end) {
    if (!json.isObject()) {
        throw std::invalid_argument("Wire::fromJson expects a JSON object");
    }
    const QJsonObject object = json.toObject();

    auto wire = std::make_unique<Wire>(object.value("id").toString().toStdString(),
                                       std::move(start), std::move(end));
    if (!wire->startTerminal()) {
        wire->m_startTerminalId = idFromJson(object.value("startTerminalId"));
    }
    if (!wire->endTerminal()) {
        wire->m_endTerminalId = idFromJson(object.value("endTerminalId"));
    }

    QJsonObject fields;
    for (const char* key : {"path", "color", "lineWidth", "lineDash", "isTemporary"}) {
        if (object.contains(key)) {
            fields[key] = object.value(key);
        }
    }
    wire->edit(fields);
    return wire;
}

TerminalResolution Wire::resolveTerminals(const TerminalMap& mapping,
                                          const std::optional<TerminalID>& startId,
                                          const std::optional<TerminalID>& endId) {
    return resolveTerminals(
        TerminalLookup([&mapping](const TerminalID& id) -> std::shared_ptr<Terminal> {
            auto it = mapping.find(id);
            return it != mapping.end() ? it->second : nullptr;
        }),
        startId, endId);
}

TerminalResolution Wire::resolveTerminals(const TerminalLookup& lookup,
                                          const std::optional<TerminalID>& startId,
                                          const std::optional<TerminalID>& endId) {
    TerminalResolution resolution;

    const TerminalID startCandidate = startId.value_or(m_startTerminalId);
    if (!startCandidate.empty()) {
        if (auto terminal = lookup(startCandidate)) {
            setStartTerminal(terminal);
            resolution.resolvedStart = true;
        }
    }

    const TerminalID endCandidate = endId.value_or(m_endTerminalId);
    if (!endCandidate.empty()) {
        if (auto terminal = lookup(endCandidate)) {
            setEndTerminal(terminal);
            resolution.resolvedEnd = true;
        }
    }

    if (!resolution.resolvedStart && !startCandidate.empty()) {
        qCDebug(logWire) << "wire" << QString::fromStdString(id()) << "start terminal"
                         << QString::fromStdString(startCandidate) << "not found";
    }
    if (!resolution.resolvedEnd && !endCandidate.empty()) {
        qCDebug(logWire) << "wire" << QString::fromStdString(id()) << "end terminal"
                         << QString::fromStdString(endCandidate) << "not found";
    }
    return resolution;
}

} // namespace circuitsketch::core::diagram
