#include "EditorSettings.h"

#include "../core/diagram/Component.h"
#include "../core/diagram/GeometryUtils.h"
#include "../core/diagram/Validation.h"
#include "../core/diagram/Wire.h"

#include <QLoggingCategory>
#include <QSettings>
#include <QString>

#include <cmath>

namespace circuitsketch::app {

Q_LOGGING_CATEGORY(logSettings, "circuitsketch.app.settings")

namespace {

void warnIgnored(const QString& source, const QVariant& value) {
    qCWarning(logSettings) << "ignoring invalid value for" << source << ":" << value.toString();
}

template <typename Setter>
void readNumber(const QSettings& settings, const QString& key, Setter&& setter) {
    if (!settings.contains(key)) {
        return;
    }
    bool ok = false;
    const QVariant raw = settings.value(key);
    const double value = raw.toDouble(&ok);
    if (!ok || !setter(value)) {
        warnIgnored(key, raw);
    }
}

template <typename Setter>
void readEnvironment(const char* name, Setter&& setter) {
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    const QString raw = qEnvironmentVariable(name).trimmed();
    bool ok = false;
    const double value = raw.toDouble(&ok);
    if (!ok || !setter(value)) {
        warnIgnored(QString::fromLatin1(name), raw);
    }
}

bool isCapacity(double value) {
    return std::isfinite(value) && value >= 0.0 && value == std::floor(value);
}

} // namespace

EditorSettings EditorSettings::load(QSettings& settings) {
    EditorSettings result;

    settings.beginGroup(QStringLiteral("editor"));
    readNumber(settings, QStringLiteral("hitMargin"),
               [&result](double v) { return result.setHitMargin(v); });
    readNumber(settings, QStringLiteral("wireWidth"),
               [&result](double v) { return result.setWireWidth(v); });
    readNumber(settings, QStringLiteral("terminalRadius"),
               [&result](double v) { return result.setTerminalRadius(v); });
    readNumber(settings, QStringLiteral("gridSize"),
               [&result](double v) { return result.setGridSize(v); });
    readNumber(settings, QStringLiteral("historyCapacity"), [&result](double v) {
        if (!isCapacity(v)) {
            return false;
        }
        result.setHistoryCapacity(static_cast<std::size_t>(v));
        return true;
    });

    if (settings.contains(QStringLiteral("wireColor"))) {
        const QVariant color = settings.value(QStringLiteral("wireColor"));
        if (!result.setWireColor(color.toString().toStdString())) {
            warnIgnored(QStringLiteral("editor/wireColor"), color);
        }
    }
    result.setSnapToGridEnabled(settings.value(QStringLiteral("snapToGrid"), false).toBool());
    settings.endGroup();

    result.applyEnvironment();
    return result;
}

void EditorSettings::save(QSettings& settings) const {
    settings.beginGroup(QStringLiteral("editor"));
    settings.setValue(QStringLiteral("hitMargin"), m_hitMargin);
    settings.setValue(QStringLiteral("wireColor"), QString::fromStdString(m_wireColor));
    settings.setValue(QStringLiteral("wireWidth"), m_wireWidth);
    settings.setValue(QStringLiteral("terminalRadius"), m_terminalRadius);
    settings.setValue(QStringLiteral("gridSize"), m_gridSize);
    settings.setValue(QStringLiteral("snapToGrid"), m_snapToGrid);
    settings.setValue(QStringLiteral("historyCapacity"), static_cast<qulonglong>(m_historyCapacity));
    settings.endGroup();
    settings.sync();
}

void EditorSettings::applyEnvironment() {
    readEnvironment("CIRCUITSKETCH_HIT_MARGIN", [this](double v) { return setHitMargin(v); });
    readEnvironment("CIRCUITSKETCH_GRID_SIZE", [this](double v) { return setGridSize(v); });
    readEnvironment("CIRCUITSKETCH_HISTORY_CAPACITY", [this](double v) {
        if (!isCapacity(v)) {
            return false;
        }
        setHistoryCapacity(static_cast<std::size_t>(v));
        return true;
    });
}

bool EditorSettings::setHitMargin(double margin) {
    if (!core::diagram::validation::isNonNegative(margin)) {
        return false;
    }
    m_hitMargin = margin;
    return true;
}

bool EditorSettings::setWireColor(const std::string& color) {
    if (!core::diagram::validation::isValidColor(color)) {
        return false;
    }
    m_wireColor = color;
    return true;
}

bool EditorSettings::setWireWidth(double width) {
    if (!core::diagram::validation::isNonNegative(width)) {
        return false;
    }
    m_wireWidth = width;
    return true;
}

bool EditorSettings::setTerminalRadius(double radius) {
    if (!core::diagram::validation::isNonNegative(radius)) {
        return false;
    }
    m_terminalRadius = radius;
    return true;
}

bool EditorSettings::setGridSize(double size) {
    if (!std::isfinite(size) || size <= 0.0) {
        return false;
    }
    m_gridSize = size;
    return true;
}

gp_Pnt2d EditorSettings::snapToGrid(const gp_Pnt2d& point) const {
    if (!m_snapToGrid) {
        return point;
    }
    return core::diagram::geometry::snapToGrid(point, m_gridSize);
}

void EditorSettings::applyTo(core::diagram::Wire& wire) const {
    // Every value here already passed the same validation the setters use
    static_cast<void>(wire.setHitMargin(m_hitMargin));
    static_cast<void>(wire.setColor(m_wireColor));
    static_cast<void>(wire.setLineWidth(m_wireWidth));
}

void EditorSettings::applyTo(core::diagram::Component& component) const {
    static_cast<void>(component.setHitMargin(m_hitMargin));
    for (const auto& terminal : component.terminals()) {
        static_cast<void>(terminal->setRadius(m_terminalRadius));
    }
}

} // namespace circuitsketch::app
