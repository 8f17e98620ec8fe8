#include "EncoderProcess.h"
#include "Logging.h"
#include <QProcess>

FfmpegProcess::FfmpegProcess(const QString& program, QObject* parent)
    : QObject(parent), m_program(program) {}

FfmpegProcess::~FfmpegProcess() = default;

EncodeResult FfmpegProcess::execute(const QStringList& arguments) {
    EncodeResult result;

    QProcess process;
    process.setProgram(m_program);
    process.setArguments(arguments);
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.setStandardOutputFile(QProcess::nullDevice());

    qCDebug(lcRender).noquote() << "Running" << m_program << arguments.join(' ');
    process.start();
    if (!process.waitForStarted(-1)) {
        result.diagnostics = QString("Failed to start %1: %2").arg(m_program, process.errorString());
        return result;
    }
    result.started = true;

    // No timeout: the encode runs to completion or fails
    process.waitForFinished(-1);

    result.crashed = process.exitStatus() == QProcess::CrashExit;
    result.exitCode = process.exitCode();
    result.diagnostics = QString::fromUtf8(process.readAllStandardError());
    if (result.crashed && result.diagnostics.isEmpty()) {
        result.diagnostics = process.errorString();
    }
    return result;
}
