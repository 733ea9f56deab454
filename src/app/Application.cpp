#include "Application.h"

#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>

namespace circuitsketch::app {

Q_LOGGING_CATEGORY(logApp, "circuitsketch.app")

Application& Application::instance() {
    static Application instance;
    return instance;
}

Application::Application()
    : QObject(nullptr) {
}

Application::~Application() {
    if (m_initialized) {
        shutdown();
    }
}

bool Application::initialize() {
    if (m_initialized) {
        qCWarning(logApp) << "initialize() called when app is already initialized";
        return true;
    }

    QCoreApplication::setApplicationName(appName());
    QCoreApplication::setApplicationVersion(appVersion());
    QCoreApplication::setOrganizationName(orgName());
    QCoreApplication::setOrganizationDomain(orgDomain());

    QSettings stored(orgName(), appName());
    m_settings = EditorSettings::load(stored);

    qCDebug(logApp) << "Editor settings loaded"
                    << "hitMargin=" << m_settings.hitMargin()
                    << "gridSize=" << m_settings.gridSize()
                    << "snapToGrid=" << m_settings.snapToGridEnabled()
                    << "historyCapacity=" << m_settings.historyCapacity();

    m_initialized = true;
    qCInfo(logApp) << "Application initialized" << appName() << appVersion();
    return true;
}

void Application::shutdown() {
    if (!m_initialized) {
        qCWarning(logApp) << "shutdown() called when app is not initialized";
        return;
    }

    m_initialized = false;
    qCInfo(logApp) << "Application shutdown completed";
}

} // namespace circuitsketch::app
