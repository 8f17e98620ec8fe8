#include <QGuiApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QLoggingCategory>
#include <cstdio>
#include "AppConstants.h"
#include "ConsoleProgress.h"
#include "ContentDescriptor.h"
#include "EncoderProcess.h"
#include "LayoutMode.h"
#include "MediaProbe.h"
#include "ScratchLayout.h"
#include "SettingsStore.h"
#include "VideoAssembler.h"

namespace {

constexpr int ExitRenderError = 1;
constexpr int ExitUsageError = 2;

} // namespace

int main(int argc, char* argv[]) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Assembles a short-form video from a prepared scratch directory.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("id", "Content id, the name of the scratch directory.");

    QCommandLineOption configOption({"c", "config"}, "Settings file (JSON).", "file");
    QCommandLineOption titleOption("title", "Content title, overrides content.json.", "text");
    QCommandLineOption clipsOption("clips", "Number of body items, overrides content.json.", "count");
    QCommandLineOption modeOption("mode", "Layout mode: flat_comments, story_title_and_body, "
                                  "story_per_paragraph or story_per_paragraph_blank.", "mode");
    QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug logging.");
    parser.addOption(configOption);
    parser.addOption(titleOption);
    parser.addOption(clipsOption);
    parser.addOption(modeOption);
    parser.addOption(verboseOption);
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption) ? "reelforge.*.debug=true"
                                                                 : "reelforge.*.debug=false");

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        std::fprintf(stderr, "%s\n", qPrintable(parser.helpText()));
        return ExitUsageError;
    }

    RenderSettings settings;
    if (parser.isSet(configOption)) {
        SettingsStore store;
        if (!store.load(parser.value(configOption), settings)) {
            std::fprintf(stderr, "%s: %s\n", qPrintable(renderErrorName(store.error())),
                         qPrintable(store.errorString()));
            return ExitUsageError;
        }
    }
    if (parser.isSet(modeOption)) {
        if (!LayoutModes::fromString(parser.value(modeOption), settings.layoutMode)) {
            std::fprintf(stderr, "Unknown layout mode: %s\n", qPrintable(parser.value(modeOption)));
            return ExitUsageError;
        }
    }

    AssemblyRequest request;
    request.jobId = positional.first();

    const bool haveOverrides = parser.isSet(titleOption) && parser.isSet(clipsOption);
    if (!haveOverrides) {
        ScratchLayout layout(settings.paths.scratchRoot, request.jobId);
        QString error;
        if (!ContentDescriptor::load(layout.contentFile(), request.jobId, request, error)) {
            std::fprintf(stderr, "%s\n", qPrintable(error));
            return ExitUsageError;
        }
    }
    if (parser.isSet(titleOption)) {
        request.title = parser.value(titleOption);
    }
    if (parser.isSet(clipsOption)) {
        bool ok = false;
        request.itemCount = parser.value(clipsOption).toInt(&ok);
        if (!ok || request.itemCount < 0) {
            std::fprintf(stderr, "Invalid clip count: %s\n", qPrintable(parser.value(clipsOption)));
            return ExitUsageError;
        }
    }

    MediaProbe probe;
    FfmpegProcess encoder(settings.encoder.program);
    VideoAssembler assembler(settings, &probe, &encoder);

    QFile errorOut;
    if (!errorOut.open(stderr, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        std::fprintf(stderr, "Cannot attach progress output to stderr\n");
        return ExitRenderError;
    }
    ConsoleProgress bar(&errorOut);

    QObject::connect(&assembler, &VideoAssembler::stageStarted, [&bar](const QString& description) {
        bar.finish();
        std::fprintf(stderr, "%s\n", qPrintable(description));
    });
    // The polling thread calls in while the main thread blocks on the encoder
    QObject::connect(&assembler, &VideoAssembler::progress, &assembler,
                     [&bar](RenderVariant variant, double fraction) {
                         bar.update(VideoAssembler::variantName(variant), fraction);
                     },
                     Qt::DirectConnection);

    const bool assembled = assembler.assemble(request);
    bar.finish();
    if (!assembled) {
        std::fprintf(stderr, "%s: %s\n", qPrintable(renderErrorName(assembler.error())),
                     qPrintable(assembler.errorString()));
        if (!assembler.diagnostics().isEmpty()) {
            std::fprintf(stderr, "%s\n", qPrintable(assembler.diagnostics()));
        }
        return assembler.error() == RenderError::Config ? ExitUsageError : ExitRenderError;
    }

    for (const QString& path : assembler.producedPaths()) {
        std::printf("%s\n", qPrintable(path));
    }
    return 0;
}
