#ifndef CIRCUITSKETCH_APP_APPLICATION_H
#define CIRCUITSKETCH_APP_APPLICATION_H

#include "EditorSettings.h"

#include <QObject>
#include <QString>

namespace circuitsketch {
namespace app {

/**
 * @brief Process-wide controller for CircuitSketch.
 *
 * Sets application metadata and loads the editor settings every diagram
 * session starts from.
 */
class Application : public QObject {
    Q_OBJECT

public:
    static Application& instance();

    bool initialize();
    void shutdown();

    const EditorSettings& settings() const { return m_settings; }
    EditorSettings& settings() { return m_settings; }

    // Application metadata
    static QString appName() { return QStringLiteral("CircuitSketch"); }
    static QString appVersion() { return QStringLiteral("0.1.0"); }
    static QString orgName() { return QStringLiteral("CircuitSketch"); }
    static QString orgDomain() { return QStringLiteral("circuitsketch.app"); }

private:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool m_initialized = false;
    EditorSettings m_settings;
};

} // namespace app
} // namespace circuitsketch

#endif // CIRCUITSKETCH_APP_APPLICATION_H
