/**
 * @file DiagramIO.h
 * @brief JSON persistence for diagrams
 *
 * A diagram file is a single JSON object:
 *   { "components": [ ... ], "wires": [ ... ] }
 * Wires reference terminals by id only. Loading is two-phase: every component
 * and wire is rebuilt first, then wire terminal ids are resolved against the
 * terminals of the loaded components.
 */
#ifndef CIRCUITSKETCH_IO_DIAGRAMIO_H
#define CIRCUITSKETCH_IO_DIAGRAMIO_H

#include <QJsonObject>
#include <QString>

#include <cstddef>
#include <optional>

namespace circuitsketch::app {
class Diagram;
}

namespace circuitsketch::io {

/**
 * @brief Counts gathered while loading
 */
struct LoadReport {
    std::size_t components = 0;
    std::size_t wires = 0;
    std::size_t unresolvedReferences = 0;
    std::size_t skippedRecords = 0;
};

class DiagramIO {
public:
    static QJsonObject toJson(const app::Diagram& diagram);

    /**
     * @brief Append the records of @p json to @p diagram
     *
     * Malformed records are skipped and counted. Terminal ids that do not
     * resolve are left pending on the wire and counted as unresolved.
     *
     * @return std::nullopt with @p errorMessage set if the top level is unusable
     */
    static std::optional<LoadReport> fromJson(const QJsonObject& json,
                                              app::Diagram& diagram,
                                              QString& errorMessage);

    /**
     * @brief Write indented JSON atomically
     */
    static bool saveToFile(const QString& path, const app::Diagram& diagram, QString& errorMessage);

    static std::optional<LoadReport> loadFromFile(const QString& path,
                                                  app::Diagram& diagram,
                                                  QString& errorMessage);

private:
    DiagramIO() = delete;
};

} // namespace circuitsketch::io

#endif // CIRCUITSKETCH_IO_DIAGRAMIO_H
