#include "PainterSurface.h"

#include <QColor>
#include <QLoggingCategory>
#include <QPainter>
#include <QPen>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>

namespace circuitsketch::render {

Q_LOGGING_CATEGORY(logPainterSurface, "circuitsketch.render.painter")

namespace {

QColor toQColor(const std::string& color) {
    QColor parsed(QString::fromStdString(color));
    if (!parsed.isValid()) {
        qCDebug(logPainterSurface) << "unparsable color, using black" << QString::fromStdString(color);
        return QColor(Qt::black);
    }
    return parsed;
}

Qt::PenCapStyle toQtCap(LineCap cap) {
    switch (cap) {
        case LineCap::Butt: return Qt::FlatCap;
        case LineCap::Round: return Qt::RoundCap;
        case LineCap::Square: return Qt::SquareCap;
    }
    return Qt::FlatCap;
}

Qt::PenJoinStyle toQtJoin(LineJoin join) {
    switch (join) {
        case LineJoin::Miter: return Qt::MiterJoin;
        case LineJoin::Round: return Qt::RoundJoin;
        case LineJoin::Bevel: return Qt::BevelJoin;
    }
    return Qt::MiterJoin;
}

} // namespace

PainterSurface::PainterSurface(QPainter& painter)
    : painter_(painter) {
}

void PainterSurface::save() {
    painter_.save();
}

void PainterSurface::restore() {
    painter_.restore();
}

void PainterSurface::setStrokeColor(const std::string& color) {
    QPen pen = painter_.pen();
    pen.setColor(toQColor(color));
    painter_.setPen(pen);
}

void PainterSurface::setStrokeWidth(double width) {
    QPen pen = painter_.pen();
    pen.setWidthF(width);
    painter_.setPen(pen);
    // Qt dash lengths are expressed in pen widths
    applyDashPattern();
}

void PainterSurface::setStrokeDash(const std::vector<double>& pattern) {
    dashPattern_ = pattern;
    applyDashPattern();
}

void PainterSurface::setStrokeCap(LineCap cap) {
    QPen pen = painter_.pen();
    pen.setCapStyle(toQtCap(cap));
    painter_.setPen(pen);
}

void PainterSurface::setStrokeJoin(LineJoin join) {
    QPen pen = painter_.pen();
    pen.setJoinStyle(toQtJoin(join));
    painter_.setPen(pen);
}

void PainterSurface::setFillColor(const std::string& color) {
    painter_.setBrush(toQColor(color));
}

void PainterSurface::beginPath() {
    path_ = QPainterPath();
}

void PainterSurface::moveTo(double x, double y) {
    path_.moveTo(x, y);
}

void PainterSurface::lineTo(double x, double y) {
    path_.lineTo(x, y);
}

void PainterSurface::closePath() {
    path_.closeSubpath();
}

void PainterSurface::circle(double cx, double cy, double radius) {
    path_.addEllipse(QPointF(cx, cy), radius, radius);
}

void PainterSurface::rectangle(double x, double y, double width, double height) {
    path_.addRect(QRectF(x, y, width, height));
}

void PainterSurface::stroke() {
    painter_.strokePath(path_, painter_.pen());
}

void PainterSurface::fill() {
    painter_.fillPath(path_, painter_.brush());
}

void PainterSurface::fillText(const std::string& text, double x, double y) {
    painter_.save();
    QPen pen = painter_.pen();
    pen.setColor(painter_.brush().color());
    painter_.setPen(pen);
    painter_.drawText(QPointF(x, y), QString::fromStdString(text));
    painter_.restore();
}

void PainterSurface::applyDashPattern() {
    QPen pen = painter_.pen();
    if (dashPattern_.empty()) {
        pen.setStyle(Qt::SolidLine);
        painter_.setPen(pen);
        return;
    }

    const double width = pen.widthF() > 0.0 ? pen.widthF() : 1.0;
    QVector<qreal> pattern;
    pattern.reserve(static_cast<int>(dashPattern_.size() * 2));
    for (double length : dashPattern_) {
        pattern.push_back(length / width);
    }
    // An odd-length pattern repeats once to make it even, as canvas dashes do
    if (pattern.size() % 2 != 0) {
        const auto count = pattern.size();
        for (decltype(pattern.size()) i = 0; i < count; ++i) {
            const qreal length = pattern[i];
            pattern.push_back(length);
        }
    }
    pen.setDashPattern(pattern);
    painter_.setPen(pen);
}

} // namespace circuitsketch::render
