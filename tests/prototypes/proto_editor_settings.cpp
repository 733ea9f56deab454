#include "test_harness/TestHarness.h"
#include "app/EditorSettings.h"
#include "diagram/Component.h"
#include "diagram/Terminal.h"
#include "diagram/Wire.h"

#include <QSettings>
#include <QTemporaryDir>
#include <QtGlobal>

using circuitsketch::app::EditorSettings;
using namespace circuitsketch::core::diagram;

namespace {

void clearOverrides() {
    qunsetenv("CIRCUITSKETCH_HIT_MARGIN");
    qunsetenv("CIRCUITSKETCH_GRID_SIZE");
    qunsetenv("CIRCUITSKETCH_HISTORY_CAPACITY");
}

} // namespace

TEST_CASE(DefaultsWithoutStoredValues) {
    clearOverrides();
    QTemporaryDir dir;
    QSettings settings(dir.filePath("empty.ini"), QSettings::IniFormat);

    const EditorSettings loaded = EditorSettings::load(settings);
    EXPECT_NEAR(loaded.hitMargin(), 5.0, 0.0);
    EXPECT_NEAR(loaded.wireWidth(), 2.0, 0.0);
    EXPECT_EQ(loaded.wireColor(), std::string("#000000"));
    EXPECT_NEAR(loaded.gridSize(), 10.0, 0.0);
    EXPECT_FALSE(loaded.snapToGridEnabled());
    EXPECT_EQ(loaded.historyCapacity(), size_t(100));
}

TEST_CASE(SaveThenLoad) {
    clearOverrides();
    QTemporaryDir dir;
    const QString path = dir.filePath("editor.ini");

    EditorSettings edited;
    EXPECT_TRUE(edited.setHitMargin(8.0));
    EXPECT_TRUE(edited.setWireColor("#336699"));
    EXPECT_TRUE(edited.setWireWidth(1.5));
    EXPECT_TRUE(edited.setGridSize(25.0));
    edited.setSnapToGridEnabled(true);
    edited.setHistoryCapacity(12);
    {
        QSettings settings(path, QSettings::IniFormat);
        edited.save(settings);
    }

    QSettings settings(path, QSettings::IniFormat);
    const EditorSettings loaded = EditorSettings::load(settings);
    EXPECT_NEAR(loaded.hitMargin(), 8.0, 1e-12);
    EXPECT_EQ(loaded.wireColor(), std::string("#336699"));
    EXPECT_NEAR(loaded.wireWidth(), 1.5, 1e-12);
    EXPECT_NEAR(loaded.gridSize(), 25.0, 1e-12);
    EXPECT_TRUE(loaded.snapToGridEnabled());
    EXPECT_EQ(loaded.historyCapacity(), size_t(12));
}

TEST_CASE(InvalidStoredValuesKeepDefaults) {
    clearOverrides();
    QTemporaryDir dir;
    QSettings settings(dir.filePath("bad.ini"), QSettings::IniFormat);
    settings.beginGroup("editor");
    settings.setValue("hitMargin", -3.0);
    settings.setValue("wireWidth", "wide");
    settings.setValue("wireColor", "not-a-color");
    settings.setValue("gridSize", 0.0);
    settings.setValue("historyCapacity", 2.5);
    settings.setValue("terminalRadius", 6.0);
    settings.endGroup();

    const EditorSettings loaded = EditorSettings::load(settings);
    EXPECT_NEAR(loaded.hitMargin(), 5.0, 0.0);
    EXPECT_NEAR(loaded.wireWidth(), 2.0, 0.0);
    EXPECT_EQ(loaded.wireColor(), std::string("#000000"));
    EXPECT_NEAR(loaded.gridSize(), 10.0, 0.0);
    EXPECT_EQ(loaded.historyCapacity(), size_t(100));
    EXPECT_NEAR(loaded.terminalRadius(), 6.0, 1e-12);
}

TEST_CASE(EnvironmentOverridesStoredValues) {
    clearOverrides();
    QTemporaryDir dir;
    QSettings settings(dir.filePath("env.ini"), QSettings::IniFormat);
    settings.beginGroup("editor");
    settings.setValue("hitMargin", 3.0);
    settings.endGroup();

    qputenv("CIRCUITSKETCH_HIT_MARGIN", "9");
    qputenv("CIRCUITSKETCH_GRID_SIZE", "-4");
    qputenv("CIRCUITSKETCH_HISTORY_CAPACITY", " 7 ");

    const EditorSettings loaded = EditorSettings::load(settings);
    EXPECT_NEAR(loaded.hitMargin(), 9.0, 1e-12);
    EXPECT_NEAR(loaded.gridSize(), 10.0, 0.0);
    EXPECT_EQ(loaded.historyCapacity(), size_t(7));
    clearOverrides();
}

TEST_CASE(SnapToGridOnlyWhenEnabled) {
    EditorSettings settings;
    const gp_Pnt2d raw(13.0, 26.0);
    EXPECT_PNT2D_NEAR(settings.snapToGrid(raw), raw, 0.0);

    settings.setSnapToGridEnabled(true);
    EXPECT_PNT2D_NEAR(settings.snapToGrid(raw), gp_Pnt2d(10.0, 30.0), 1e-12);
    EXPECT_TRUE(settings.setGridSize(4.0));
    EXPECT_PNT2D_NEAR(settings.snapToGrid(raw), gp_Pnt2d(12.0, 28.0), 1e-12);
}

TEST_CASE(ApplyToGivesEntitiesConfiguredDefaults) {
    EditorSettings settings;
    EXPECT_TRUE(settings.setHitMargin(2.0));
    EXPECT_TRUE(settings.setWireColor("#ff8800"));
    EXPECT_TRUE(settings.setWireWidth(4.0));
    EXPECT_TRUE(settings.setTerminalRadius(3.0));

    Wire wire;
    settings.applyTo(wire);
    EXPECT_EQ(wire.color(), std::string("#ff8800"));
    EXPECT_NEAR(wire.lineWidth(), 4.0, 0.0);
    EXPECT_NEAR(wire.hitTolerance(), 4.0, 1e-12);

    Component part(0.0, 0.0, 10.0, 10.0);
    auto terminal = part.addTerminal("t", 0.0, 0.0);
    settings.applyTo(part);
    EXPECT_NEAR(part.hitMargin(), 2.0, 0.0);
    EXPECT_NEAR(terminal->radius(), 3.0, 0.0);
}

int main() {
    return circuitsketch::test::runAllTests();
}
