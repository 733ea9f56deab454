/**
 * @file Wire.h
 * @brief Polyline connection between two optional terminals
 *
 * A wire is made of an optional start terminal, an ordered list of interior
 * bend points and an optional end terminal. The rendered geometry is derived
 * on every query, so a wire follows the components its terminals belong to
 * without any bookkeeping on the wire side.
 *
 * Terminal references are non-owning (std::weak_ptr). When the owning
 * component goes away the reference expires and reads back as nullptr, while
 * the cached terminal id is kept so the dangling link can still be reported.
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_WIRE_H
#define CIRCUITSKETCH_CORE_DIAGRAM_WIRE_H

#include "Shape.h"

#include <QJsonValue>
#include <gp_Pnt2d.hxx>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace circuitsketch::core::diagram {

class Terminal;

/**
 * @brief id -> terminal table built after every component is loaded
 */
using TerminalMap = std::unordered_map<TerminalID, std::shared_ptr<Terminal>>;

/**
 * @brief Terminal lookup; returns nullptr on a miss
 */
using TerminalLookup = std::function<std::shared_ptr<Terminal>(const TerminalID&)>;

/**
 * @brief Outcome of the second loading phase
 */
struct TerminalResolution {
    bool resolvedStart = false;
    bool resolvedEnd = false;
};

class Wire : public Shape {
public:
    explicit Wire(std::shared_ptr<Terminal> start = nullptr,
                  std::shared_ptr<Terminal> end = nullptr);
    explicit Wire(const EntityID& id,
                  std::shared_ptr<Terminal> start = nullptr,
                  std::shared_ptr<Terminal> end = nullptr);

    //--------------------------------------------------------------------------
    // Terminals
    //--------------------------------------------------------------------------

    /**
     * @brief Live start terminal, nullptr if unset or expired
     */
    std::shared_ptr<Terminal> startTerminal() const { return m_startTerminal.lock(); }
    std::shared_ptr<Terminal> endTerminal() const { return m_endTerminal.lock(); }

    /**
     * @brief Attach (or with nullptr, detach) the start terminal
     *
     * Only the wire side of the relation is updated; recording the wire on
     * the terminal is the caller's job.
     */
    void setStartTerminal(const std::shared_ptr<Terminal>& terminal);
    void setEndTerminal(const std::shared_ptr<Terminal>& terminal);

    /**
     * @brief Id of the current or pending start reference, empty if none
     */
    const TerminalID& startTerminalId() const { return m_startTerminalId; }
    const TerminalID& endTerminalId() const { return m_endTerminalId; }

    /**
     * @brief True if either terminal reference is live
     */
    bool isAttached() const;

    /**
     * @brief Clear both references and their cached ids
     */
    void disconnect();

    //--------------------------------------------------------------------------
    // Path
    //--------------------------------------------------------------------------

    const std::vector<gp_Pnt2d>& path() const { return m_path; }

    /**
     * @brief Replace every interior point at once
     */
    FieldResult setPath(std::vector<gp_Pnt2d> points);

    /**
     * @brief Append an interior point
     */
    FieldResult addPoint(double x, double y);

    /**
     * @brief Insert before @p index; index == path().size() appends
     */
    FieldResult insertPoint(size_t index, const gp_Pnt2d& point);

    /**
     * @brief Replace the interior point at @p index
     */
    FieldResult setPoint(size_t index, const gp_Pnt2d& point);

    /**
     * @brief Remove the interior point at @p index
     * @return false (and no change) if @p index is out of range
     */
    bool removePoint(size_t index);

    /**
     * @brief Start terminal position, interior path, end terminal position
     *
     * Expired or unset terminals contribute nothing, so the result holds
     * between 0 and path().size() + 2 points.
     */
    std::vector<gp_Pnt2d> getAllPoints() const;

    //--------------------------------------------------------------------------
    // Style
    //--------------------------------------------------------------------------

    const std::string& color() const { return m_color; }
    FieldResult setColor(const std::string& color);

    double lineWidth() const { return m_lineWidth; }
    FieldResult setLineWidth(double width);

    const std::vector<double>& lineDash() const { return m_lineDash; }
    FieldResult setLineDash(std::vector<double> pattern);

    bool isTemporary() const { return m_isTemporary; }
    void setTemporary(bool temporary) { m_isTemporary = temporary; }

    /**
     * @brief lineWidth / 2 + hitMargin
     */
    double hitTolerance() const;

    //--------------------------------------------------------------------------
    // Shape Interface
    //--------------------------------------------------------------------------

    EntityType type() const override { return EntityType::Wire; }
    std::string typeName() const override { return "Wire"; }

    void draw(render::RenderSurface& surface) const override;

    /**
     * @brief Clamped point-to-segment distance test against hitTolerance()
     */
    bool isHit(double x, double y) const override;

    /**
     * @brief Index of the first segment within tolerance, -1 on miss
     *
     * Segment i joins getAllPoints()[i] and getAllPoints()[i + 1].
     */
    int hitSegment(double x, double y) const;

    /**
     * @brief Translate the interior path; no-op while attached to any terminal
     */
    void move(double dx, double dy) override;

    /**
     * @brief Accepts color, lineWidth, lineDash, isTemporary and path
     */
    EditResult edit(const QJsonObject& properties) override;

    /**
     * @brief {id, type, startTerminalId, endTerminalId, path, color, lineWidth, lineDash}
     *
     * Terminals are written as ids only. A pending (not yet resolved)
     * reference keeps its id so an unresolved link survives a save.
     */
    QJsonObject toJson() const override;

    /**
     * @brief Rebuild a wire from its record
     *
     * Supplied terminals are attached directly. Otherwise the persisted ids
     * are kept as pending references for resolveTerminals().
     *
     * @throws std::invalid_argument if @p json is not an object
     */
    static std::unique_ptr<Wire> fromJson(const QJsonValue& json,
                                          std::shared_ptr<Terminal> start = nullptr,
                                          std::shared_ptr<Terminal> end = nullptr);

    /**
     * @brief Second loading phase: turn terminal ids into live references
     *
     * Explicit ids win over the cached ones. A miss leaves the reference as
     * it was and reports false for that end.
     */
    TerminalResolution resolveTerminals(const TerminalMap& mapping,
                                        const std::optional<TerminalID>& startId = std::nullopt,
                                        const std::optional<TerminalID>& endId = std::nullopt);
    TerminalResolution resolveTerminals(const TerminalLookup& lookup,
                                        const std::optional<TerminalID>& startId = std::nullopt,
                                        const std::optional<TerminalID>& endId = std::nullopt);

private:
    std::weak_ptr<Terminal> m_startTerminal;
    std::weak_ptr<Terminal> m_endTerminal;
    TerminalID m_startTerminalId;
    TerminalID m_endTerminalId;
    std::vector<gp_Pnt2d> m_path;
    std::string m_color = constants::DEFAULT_STROKE_COLOR;
    double m_lineWidth = constants::DEFAULT_WIRE_WIDTH;
    std::vector<double> m_lineDash;
    bool m_isTemporary = false;
};

} // namespace circuitsketch::core::diagram

#endif // CIRCUITSKETCH_CORE_DIAGRAM_WIRE_H
