/**
 * @file DiagramIO.cpp
 * @brief Implementation of diagram serialization
 */

#include "DiagramIO.h"
#include "../app/document/Diagram.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>

#include <stdexcept>
#include <utility>
#include <vector>

namespace circuitsketch::io {

Q_LOGGING_CATEGORY(logIO, "circuitsketch.io")

using core::diagram::Component;
using core::diagram::Wire;

QJsonObject DiagramIO::toJson(const app::Diagram& diagram) {
    QJsonArray components;
    for (const Component* component : diagram.components()) {
        components.append(component->toJson());
    }

    QJsonArray wires;
    for (const Wire* wire : diagram.wires()) {
        wires.append(wire->toJson());
    }

    QJsonObject json;
    json["components"] = components;
    json["wires"] = wires;
    return json;
}

std::optional<LoadReport> DiagramIO::fromJson(const QJsonObject& json,
                                              app::Diagram& diagram,
                                              QString& errorMessage) {
    const QJsonValue componentsValue = json.value("components");
    const QJsonValue wiresValue = json.value("wires");
    if ((!componentsValue.isUndefined() && !componentsValue.isArray()) ||
        (!wiresValue.isUndefined() && !wiresValue.isArray())) {
        errorMessage = "Diagram 'components' and 'wires' must be arrays";
        return std::nullopt;
    }

    LoadReport report;

    // 1. Components with their terminals
    for (const QJsonValue& entry : componentsValue.toArray()) {
        try {
            auto component = Component::fromJson(entry);
            if (diagram.addComponent(std::move(component)).empty()) {
                ++report.skippedRecords;
                continue;
            }
            ++report.components;
        } catch (const std::invalid_argument& e) {
            qCWarning(logIO) << "Skipping component record:" << e.what();
            ++report.skippedRecords;
        }
    }

    // 2. Wires, terminal ids kept pending
    std::vector<Wire*> loadedWires;
    for (const QJsonValue& entry : wiresValue.toArray()) {
        try {
            auto wire = Wire::fromJson(entry);
            Wire* raw = wire.get();
            if (diagram.addWire(std::move(wire)).empty()) {
                ++report.skippedRecords;
                continue;
            }
            loadedWires.push_back(raw);
            ++report.wires;
        } catch (const std::invalid_argument& e) {
            qCWarning(logIO) << "Skipping wire record:" << e.what();
            ++report.skippedRecords;
        }
    }

    // 3. Resolve terminal references
    const core::diagram::TerminalMap terminals = diagram.terminalMap();
    for (Wire* wire : loadedWires) {
        const auto resolution = wire->resolveTerminals(terminals);
        if (!wire->startTerminalId().empty() && !resolution.resolvedStart) {
            ++report.unresolvedReferences;
        }
        if (!wire->endTerminalId().empty() && !resolution.resolvedEnd) {
            ++report.unresolvedReferences;
        }
        diagram.registerWireOnTerminals(*wire);
    }

    qCInfo(logIO) << "Loaded" << report.components << "components," << report.wires << "wires,"
                  << report.unresolvedReferences << "unresolved terminal references";
    return report;
}

bool DiagramIO::saveToFile(const QString& path, const app::Diagram& diagram, QString& errorMessage) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        errorMessage = QString("Cannot open %1 for writing: %2").arg(path, file.errorString());
        return false;
    }

    const QByteArray data = QJsonDocument(toJson(diagram)).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        errorMessage = QString("Failed to write %1: %2").arg(path, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        errorMessage = QString("Failed to commit %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

std::optional<LoadReport> DiagramIO::loadFromFile(const QString& path,
                                                  app::Diagram& diagram,
                                                  QString& errorMessage) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        errorMessage = QString("Cannot open %1: %2").arg(path, file.errorString());
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        errorMessage = QString("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        return std::nullopt;
    }
    if (!document.isObject()) {
        errorMessage = QString("%1 does not contain a diagram object").arg(path);
        return std::nullopt;
    }

    return fromJson(document.object(), diagram, errorMessage);
}

} // namespace circuitsketch::io
