/**
 * @file RenderSurface.h
 * @brief Drawing capability contract consumed by the diagram model
 *
 * The core never talks to a concrete backend. Shapes push style state and
 * path commands through this interface; PainterSurface maps them to QPainter
 * and tests substitute a recording stub.
 */

#ifndef CIRCUITSKETCH_RENDER_RENDERSURFACE_H
#define CIRCUITSKETCH_RENDER_RENDERSURFACE_H

#include <string>
#include <vector>

namespace circuitsketch::render {

enum class LineCap {
    Butt,
    Round,
    Square
};

enum class LineJoin {
    Miter,
    Round,
    Bevel
};

/**
 * @brief Stateful 2D drawing surface
 *
 * Style setters affect subsequent stroke()/fill() calls until the matching
 * restore(). Path commands accumulate into the current path, which
 * beginPath() discards.
 */
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    // State stack
    virtual void save() = 0;
    virtual void restore() = 0;

    // Style
    virtual void setStrokeColor(const std::string& color) = 0;
    virtual void setStrokeWidth(double width) = 0;
    virtual void setStrokeDash(const std::vector<double>& pattern) = 0;
    virtual void setStrokeCap(LineCap cap) = 0;
    virtual void setStrokeJoin(LineJoin join) = 0;
    virtual void setFillColor(const std::string& color) = 0;

    // Path construction
    virtual void beginPath() = 0;
    virtual void moveTo(double x, double y) = 0;
    virtual void lineTo(double x, double y) = 0;
    virtual void closePath() = 0;

    /**
     * @brief Append a full circle as a closed sub-path
     */
    virtual void circle(double cx, double cy, double radius) = 0;

    /**
     * @brief Append an axis-aligned rectangle as a closed sub-path
     */
    virtual void rectangle(double x, double y, double width, double height) = 0;

    // Painting
    virtual void stroke() = 0;
    virtual void fill() = 0;
    virtual void fillText(const std::string& text, double x, double y) = 0;
};

/**
 * @brief Scoped save()/restore() pair
 */
class SurfaceStateGuard {
public:
    explicit SurfaceStateGuard(RenderSurface& surface)
        : surface_(surface) {
        surface_.save();
    }

    ~SurfaceStateGuard() { surface_.restore(); }

    SurfaceStateGuard(const SurfaceStateGuard&) = delete;
    SurfaceStateGuard& operator=(const SurfaceStateGuard&) = delete;

private:
    RenderSurface& surface_;
};

} // namespace circuitsketch::render

#endif // CIRCUITSKETCH_RENDER_RENDERSURFACE_H
