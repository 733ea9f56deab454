/**
 * @file Handle.h
 * @brief Selection handle markers drawn on top of selected entities
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_HANDLE_H
#define CIRCUITSKETCH_CORE_DIAGRAM_HANDLE_H

#include "DiagramTypes.h"

#include <gp_Pnt2d.hxx>

#include <string>

namespace circuitsketch::render {
class RenderSurface;
}

namespace circuitsketch::core::diagram {

/**
 * @brief A small marker centered on a point
 *
 * Colors use Qt color names; 8-digit hex is #AARRGGBB.
 */
class Handle {
public:
    Handle(const gp_Pnt2d& center, HandleType type);

    const gp_Pnt2d& center() const { return m_center; }
    HandleType type() const { return m_type; }

    double size() const { return m_size; }
    void setSize(double size);

    double borderSize() const { return m_borderSize; }
    void setBorderSize(double borderSize);

    const std::string& fillColor() const { return m_fillColor; }
    void setFillColor(const std::string& color) { m_fillColor = color; }

    const std::string& borderColor() const { return m_borderColor; }
    void setBorderColor(const std::string& color) { m_borderColor = color; }

    /**
     * @brief Top-left corner of the marker box, border included
     */
    gp_Pnt2d topLeft() const;

    void draw(render::RenderSurface& surface) const;

private:
    void drawSquare(render::RenderSurface& surface) const;
    void drawDot(render::RenderSurface& surface) const;

    gp_Pnt2d m_center;
    HandleType m_type;
    double m_size = constants::DEFAULT_HANDLE_SIZE;
    double m_borderSize = 1.0;
    std::string m_fillColor = "#6600ccff";
    std::string m_borderColor = "#00ccff";
};

} // namespace circuitsketch::core::diagram

#endif // CIRCUITSKETCH_CORE_DIAGRAM_HANDLE_H
