/**
 * @file PainterSurface.h
 * @brief RenderSurface backend drawing through QPainter
 */

#ifndef CIRCUITSKETCH_RENDER_PAINTERSURFACE_H
#define CIRCUITSKETCH_RENDER_PAINTERSURFACE_H

#include "RenderSurface.h"

#include <QPainterPath>

class QPainter;

namespace circuitsketch::render {

/**
 * @brief Adapts the RenderSurface contract to an active QPainter
 *
 * Stroke and fill style live on the painter's pen and brush, so
 * save()/restore() map straight onto QPainter::save()/restore(). The current
 * path is surface state and is not part of the saved painter state.
 */
class PainterSurface : public RenderSurface {
public:
    explicit PainterSurface(QPainter& painter);
    ~PainterSurface() override = default;

    void save() override;
    void restore() override;

    void setStrokeColor(const std::string& color) override;
    void setStrokeWidth(double width) override;
    void setStrokeDash(const std::vector<double>& pattern) override;
    void setStrokeCap(LineCap cap) override;
    void setStrokeJoin(LineJoin join) override;
    void setFillColor(const std::string& color) override;

    void beginPath() override;
    void moveTo(double x, double y) override;
    void lineTo(double x, double y) override;
    void closePath() override;
    void circle(double cx, double cy, double radius) override;
    void rectangle(double x, double y, double width, double height) override;

    void stroke() override;
    void fill() override;
    void fillText(const std::string& text, double x, double y) override;

    const QPainterPath& currentPath() const { return path_; }

private:
    void applyDashPattern();

    QPainter& painter_;
    QPainterPath path_;
    std::vector<double> dashPattern_;
};

} // namespace circuitsketch::render

#endif // CIRCUITSKETCH_RENDER_PAINTERSURFACE_H
