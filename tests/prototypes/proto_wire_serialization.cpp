#include "test_harness/TestHarness.h"
#include "diagram/Component.h"
#include "diagram/Wire.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <stdexcept>

using namespace circuitsketch::core::diagram;

TEST_CASE(ToJson_WritesTerminalIdsOnly) {
    Component part(0.0, 0.0, 10.0, 10.0);
    Wire wire(part.addTerminal("t1", 0.0, 0.0), nullptr);
    wire.addPoint(20.0, 20.0);

    const QJsonObject json = wire.toJson();
    EXPECT_EQ(json.value("type").toString().toStdString(), std::string("Wire"));
    EXPECT_EQ(json.value("id").toString().toStdString(), wire.id());
    EXPECT_TRUE(json.value("startTerminalId").isString());
    EXPECT_EQ(json.value("startTerminalId").toString().toStdString(), std::string("t1"));
    EXPECT_TRUE(json.value("endTerminalId").isNull());
    EXPECT_EQ(json.value("path").toArray().size(), 1);
    EXPECT_TRUE(json.value("lineDash").isArray());
}

TEST_CASE(RoundTrip_KeepsPathAndStyle) {
    Wire wire;
    wire.addPoint(0.5, 1.25);
    wire.addPoint(-3.0, 7.0);
    wire.addPoint(100.0, 0.0);
    wire.setColor("#00ff00");
    wire.setLineWidth(3.5);
    wire.setLineDash({5.0, 2.5, 1.0});

    // Through text as well, as a saved file would
    const QByteArray text = QJsonDocument(wire.toJson()).toJson(QJsonDocument::Compact);
    auto copy = Wire::fromJson(QJsonDocument::fromJson(text).object());

    EXPECT_EQ(copy->id(), wire.id());
    EXPECT_EQ(copy->path().size(), wire.path().size());
    for (size_t i = 0; i < wire.path().size(); ++i) {
        EXPECT_PNT2D_NEAR(copy->path()[i], wire.path()[i], 0.0);
    }
    EXPECT_EQ(copy->color(), wire.color());
    EXPECT_NEAR(copy->lineWidth(), 3.5, 0.0);
    EXPECT_EQ(copy->lineDash().size(), size_t(3));
    EXPECT_NEAR(copy->lineDash()[1], 2.5, 0.0);
}

TEST_CASE(FromJson_RejectsNonObject) {
    EXPECT_THROWS_AS(Wire::fromJson(QJsonValue(QStringLiteral("wire"))), std::invalid_argument);
    EXPECT_THROWS_AS(Wire::fromJson(QJsonValue()), std::invalid_argument);
    EXPECT_THROWS_AS(Wire::fromJson(QJsonArray{1, 2}), std::invalid_argument);
}

TEST_CASE(FromJson_BadFieldsFallBackToDefaults) {
    QJsonObject record;
    record["lineWidth"] = "thick";
    record["color"] = 42;
    record["path"] = QJsonArray{QJsonObject{{"x", 1.0}}};

    auto wire = Wire::fromJson(record);
    EXPECT_NEAR(wire->lineWidth(), 2.0, 0.0);
    EXPECT_EQ(wire->color(), std::string("#000000"));
    EXPECT_TRUE(wire->path().empty());
    EXPECT_FALSE(wire->id().empty());
}

TEST_CASE(PendingReference_SurvivesSave) {
    QJsonObject record;
    record["id"] = "w-1";
    record["startTerminalId"] = "t-unknown";
    record["endTerminalId"] = QJsonValue::Null;

    auto wire = Wire::fromJson(record);
    const QJsonObject saved = wire->toJson();
    EXPECT_EQ(saved.value("startTerminalId").toString().toStdString(), std::string("t-unknown"));
    EXPECT_TRUE(saved.value("endTerminalId").isNull());
}

TEST_CASE(ApplySnapshot_RestoresEditableState) {
    Wire wire;
    wire.addPoint(0.0, 0.0);
    wire.addPoint(10.0, 0.0);
    const QJsonObject snapshot = wire.toJson();

    wire.addPoint(20.0, 5.0);
    wire.setColor("blue");
    EXPECT_TRUE(wire.applySnapshot(snapshot).ok());
    EXPECT_EQ(wire.path().size(), size_t(2));
    EXPECT_EQ(wire.color(), std::string("#000000"));
}

int main() {
    return circuitsketch::test::runAllTests();
}
