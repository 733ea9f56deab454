#include "Validation.h"

#include <QColor>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <cmath>

namespace circuitsketch::core::diagram::validation {

bool isValidColor(const std::string& color) {
    if (color.empty()) {
        return false;
    }
    return QColor(QString::fromStdString(color)).isValid();
}

bool isNonNegative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

std::optional<double> numberFrom(const QJsonValue& value) {
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double number = value.toDouble();
    if (!std::isfinite(number)) {
        return std::nullopt;
    }
    return number;
}

std::optional<std::vector<double>> dashPatternFrom(const QJsonValue& value) {
    if (!value.isArray()) {
        return std::nullopt;
    }

    const QJsonArray array = value.toArray();
    std::vector<double> pattern;
    pattern.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& entry : array) {
        auto number = numberFrom(entry);
        if (!number || *number < 0.0) {
            return std::nullopt;
        }
        pattern.push_back(*number);
    }
    return pattern;
}

std::optional<std::vector<gp_Pnt2d>> pointListFrom(const QJsonValue& value) {
    if (!value.isArray()) {
        return std::nullopt;
    }

    const QJsonArray array = value.toArray();
    std::vector<gp_Pnt2d> points;
    points.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& entry : array) {
        if (!entry.isObject()) {
            return std::nullopt;
        }
        const QJsonObject point = entry.toObject();
        auto x = numberFrom(point.value("x"));
        auto y = numberFrom(point.value("y"));
        if (!x || !y) {
            return std::nullopt;
        }
        points.emplace_back(*x, *y);
    }
    return points;
}

} // namespace circuitsketch::core::diagram::validation
