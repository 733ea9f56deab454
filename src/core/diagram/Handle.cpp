#include "Handle.h"

#include "../../render/RenderSurface.h"

#include <algorithm>
#include <cmath>

namespace circuitsketch::core::diagram {

Handle::Handle(const gp_Pnt2d& center, HandleType type)
    : m_center(center),
      m_type(type) {
}

void Handle::setSize(double size) {
    if (std::isfinite(size) && size > 0.0) {
        m_size = size;
    }
}

void Handle::setBorderSize(double borderSize) {
    if (std::isfinite(borderSize) && borderSize >= 0.0) {
        m_borderSize = borderSize;
    }
}

gp_Pnt2d Handle::topLeft() const {
    const double offset = m_size / 2.0 + m_borderSize / 2.0;
    return gp_Pnt2d(m_center.X() - offset, m_center.Y() - offset);
}

void Handle::draw(render::RenderSurface& surface) const {
    switch (m_type) {
        case HandleType::Square:
            drawSquare(surface);
            break;
        case HandleType::Dot:
            drawDot(surface);
            break;
    }
}

void Handle::drawSquare(render::RenderSurface& surface) const {
    const gp_Pnt2d corner = topLeft();
    const double innerSize = std::max(0.0, m_size - m_borderSize);

    render::SurfaceStateGuard guard(surface);
    surface.setStrokeColor(m_borderColor);
    surface.setFillColor(m_fillColor);
    surface.setStrokeWidth(m_borderSize);

    surface.beginPath();
    surface.rectangle(corner.X(), corner.Y(), innerSize, innerSize);
    surface.fill();

    surface.beginPath();
    surface.rectangle(corner.X(), corner.Y(), m_size, m_size);
    surface.stroke();
}

void Handle::drawDot(render::RenderSurface& surface) const {
    const gp_Pnt2d corner = topLeft();
    const double radius = std::max(0.0, (m_size - m_borderSize) / 2.0);

    render::SurfaceStateGuard guard(surface);
    surface.setStrokeColor(m_borderColor);
    surface.setFillColor(m_fillColor);
    surface.setStrokeWidth(m_borderSize);

    surface.beginPath();
    surface.circle(corner.X() + m_size / 2.0, corner.Y() + m_size / 2.0, radius);
    surface.fill();
    surface.stroke();
}

} // namespace circuitsketch::core::diagram
