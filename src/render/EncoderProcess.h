#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

struct EncodeResult {
    bool started = false;
    bool crashed = false;
    int exitCode = -1;
    QString diagnostics;    // encoder stderr, or the start failure reason

    bool succeeded() const { return started && !crashed && exitCode == 0; }
};

// One blocking run of the external encoder.
class EncoderProcess {
public:
    virtual ~EncoderProcess() = default;

    virtual EncodeResult execute(const QStringList& arguments) = 0;
};

// Runs the ffmpeg executable through QProcess. Stdout is discarded; stderr
// is kept as the diagnostic stream.
class FfmpegProcess : public QObject, public EncoderProcess {
    Q_OBJECT
public:
    explicit FfmpegProcess(const QString& program, QObject* parent = nullptr);
    ~FfmpegProcess();

    QString program() const { return m_program; }

    EncodeResult execute(const QStringList& arguments) override;

private:
    QString m_program;
};
