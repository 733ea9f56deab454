#include "Shape.h"

#include <QString>
#include <QUuid>

#include <cmath>

namespace circuitsketch::core::diagram {

Shape::Shape()
    : m_id(generateId()) {
}

Shape::Shape(const EntityID& id)
    : m_id(id.empty() ? generateId() : id) {
}

FieldResult Shape::setHitMargin(double margin) {
    if (!std::isfinite(margin) || margin < 0.0) {
        return FieldResult::rejected("hitMargin", "hit margin must be a non-negative number");
    }
    m_hitMargin = margin;
    return FieldResult::ok("hitMargin");
}

QJsonObject Shape::baseJson() const {
    QJsonObject json;
    json["id"] = QString::fromStdString(m_id);
    json["type"] = QString::fromStdString(typeName());
    return json;
}

EntityID Shape::generateId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

} // namespace circuitsketch::core::diagram
