#include <QColor>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QGuiApplication>
#include <QImage>
#include <QLoggingCategory>
#include <QPainter>
#include <QSize>

#include "app/Application.h"
#include "app/Logging.h"
#include "app/document/Diagram.h"
#include "io/DiagramIO.h"
#include "render/PainterSurface.h"

// OpenCASCADE (OCCT)
#include <Standard_Version.hxx>

Q_LOGGING_CATEGORY(logMain, "circuitsketch.main")

namespace {

bool parseSize(const QString& text, QSize& size) {
    const QStringList parts = text.toLower().split('x');
    if (parts.size() != 2) {
        return false;
    }
    bool okWidth = false;
    bool okHeight = false;
    const int width = parts[0].toInt(&okWidth);
    const int height = parts[1].toInt(&okHeight);
    if (!okWidth || !okHeight || width <= 0 || height <= 0) {
        return false;
    }
    size = QSize(width, height);
    return true;
}

bool renderToImage(const circuitsketch::app::Diagram& diagram, const QSize& size, const QString& path) {
    QImage image(size, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::white);

    {
        QPainter painter(&image);
        painter.setRenderHint(QPainter::Antialiasing, true);
        circuitsketch::render::PainterSurface surface(painter);
        diagram.draw(surface);
    }

    return image.save(path);
}

} // namespace

int main(int argc, char* argv[]) {
#ifdef NDEBUG
    constexpr bool debugBuild = false;
#else
    constexpr bool debugBuild = true;
#endif

    using circuitsketch::app::Application;
    using circuitsketch::app::Logging;

    QCoreApplication::setApplicationName(Application::appName());
    QCoreApplication::setApplicationVersion(Application::appVersion());

    if (!Logging::initialize(Application::appName(), debugBuild)) {
        return 1;
    }

    QGuiApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Load, check and render CircuitSketch diagrams"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("diagram"), QStringLiteral("Diagram JSON file to load"));

    const QCommandLineOption renderOption(QStringLiteral("render"),
                                          QStringLiteral("Render the diagram to a PNG <file>."),
                                          QStringLiteral("file"));
    const QCommandLineOption saveOption(QStringLiteral("save"),
                                        QStringLiteral("Write the loaded diagram back to <file>."),
                                        QStringLiteral("file"));
    const QCommandLineOption sizeOption(QStringLiteral("size"),
                                        QStringLiteral("Image size for --render, as WIDTHxHEIGHT."),
                                        QStringLiteral("size"),
                                        QStringLiteral("800x600"));
    parser.addOption(renderOption);
    parser.addOption(saveOption);
    parser.addOption(sizeOption);
    parser.process(app);

    Application& circuitSketch = Application::instance();
    if (!circuitSketch.initialize()) {
        qCCritical(logMain) << "Failed to initialize application";
        Logging::shutdown();
        return 1;
    }

    qCInfo(logMain) << "Dependency versions"
                    << "qt=" << qVersion()
                    << "occt=" << OCC_VERSION_COMPLETE;

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(2);
    }

    int exitCode = 0;
    circuitsketch::app::Diagram diagram;
    QString errorMessage;
    const auto report = circuitsketch::io::DiagramIO::loadFromFile(positional.front(), diagram, errorMessage);
    if (!report) {
        qCCritical(logMain).noquote() << errorMessage;
        exitCode = 1;
    } else {
        qCInfo(logMain) << "Loaded" << positional.front()
                        << "components=" << report->components
                        << "wires=" << report->wires
                        << "unresolvedReferences=" << report->unresolvedReferences
                        << "skippedRecords=" << report->skippedRecords;

        for (const auto& wireId : diagram.danglingReferences()) {
            qCWarning(logMain) << "Wire with dangling terminal reference:" << QString::fromStdString(wireId);
        }

        if (parser.isSet(renderOption)) {
            QSize size;
            if (!parseSize(parser.value(sizeOption), size)) {
                qCCritical(logMain) << "Invalid --size value" << parser.value(sizeOption);
                exitCode = 2;
            } else if (!renderToImage(diagram, size, parser.value(renderOption))) {
                qCCritical(logMain) << "Failed to write image" << parser.value(renderOption);
                exitCode = 1;
            } else {
                qCInfo(logMain) << "Rendered" << parser.value(renderOption);
            }
        }

        if (exitCode == 0 && parser.isSet(saveOption)) {
            if (!circuitsketch::io::DiagramIO::saveToFile(parser.value(saveOption), diagram, errorMessage)) {
                qCCritical(logMain).noquote() << errorMessage;
                exitCode = 1;
            } else {
                qCInfo(logMain) << "Saved" << parser.value(saveOption);
            }
        }
    }

    circuitSketch.shutdown();
    Logging::shutdown();
    return exitCode;
}
