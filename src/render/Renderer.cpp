#include "Renderer.h"
#include "AppConstants.h"
#include "EncoderProcess.h"
#include "Logging.h"
#include <QThread>

int EncoderSettings::effectiveThreads() const {
    return threads > 0 ? threads : QThread::idealThreadCount();
}

Renderer::Renderer(EncoderProcess* encoder, const EncoderSettings& settings)
    : m_encoder(encoder)
    , m_settings(settings)
    , m_pollIntervalMs(AppConstants::ProgressPollIntervalMs) {}

QStringList Renderer::buildArguments(const CompositionGraph& graph, const QString& outputPath,
                                     const QString& progressChannel) const {
    QStringList args;
    args << "-y" << "-hide_banner" << "-nostats" << "-loglevel" << "error"
         << "-progress" << progressChannel;
    args << graph.inputArguments();
    args << "-filter_complex" << graph.filterComplex();
    args << graph.mapArguments();
    args << "-f" << m_settings.format
         << "-c:v" << m_settings.videoCodec
         << "-b:v" << m_settings.videoBitrate
         << "-b:a" << m_settings.audioBitrate
         << "-threads" << QString::number(m_settings.effectiveThreads());
    args << outputPath;
    return args;
}

bool Renderer::render(const CompositionGraph& graph, const QString& outputPath,
                      double expectedDurationSeconds, const ProgressCallback& progress) {
    m_error = RenderError::None;
    m_errorString.clear();
    m_diagnostics.clear();
    m_producedPath.clear();

    QString graphError;
    if (!graph.validate(&graphError))
        return fail(RenderError::GraphBuild, graphError);
    if (!m_encoder)
        return fail(RenderError::Encode, "No encoder configured");

    ProgressMonitor monitor(expectedDurationSeconds, progress);
    monitor.setPollInterval(m_pollIntervalMs);
    if (!monitor.start())
        return fail(RenderError::Encode, monitor.errorString());

    const QStringList args = buildArguments(graph, outputPath, monitor.channelPath());
    qCInfo(lcRender).noquote() << "Rendering" << outputPath;

    const EncodeResult result = m_encoder->execute(args);
    monitor.stop();

    if (!result.succeeded()) {
        m_diagnostics = result.diagnostics;
        QString reason;
        if (!result.started) reason = "encoder failed to start";
        else if (result.crashed) reason = "encoder crashed";
        else reason = QString("encoder exited with code %1").arg(result.exitCode);

        qCCritical(lcRender).noquote() << m_diagnostics;
        return fail(RenderError::Encode, QString("%1: %2").arg(outputPath, reason));
    }

    if (progress) {
        progress(1.0);
    }
    m_producedPath = outputPath;
    return true;
}

bool Renderer::fail(RenderError error, const QString& message) {
    m_error = error;
    m_errorString = message;
    qCCritical(lcRender).noquote() << renderErrorName(error) << message;
    return false;
}
