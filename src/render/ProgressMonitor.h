#pragma once

#include <QObject>
#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QByteArray>
#include <QString>
#include <functional>
#include <memory>

class QFile;
class QTemporaryFile;

// Receives elapsed / expected duration. Values slightly above 1.0 are
// possible near the end of an encode.
using ProgressCallback = std::function<void(double fraction)>;

// Background thread that re-reads the progress channel every interval and
// reports the newest out_time_ms sample. Sleeps on a wait condition so a
// stop request wakes it immediately.
class ProgressPollThread : public QThread {
    Q_OBJECT
public:
    ProgressPollThread(const QString& channelPath, double expectedSeconds, int intervalMs,
                       ProgressCallback callback, QObject* parent = nullptr);

    void requestStop();

protected:
    void run() override;

private:
    void poll(QFile& channel);

    QString m_channelPath;
    double m_expectedSeconds;
    int m_intervalMs;
    ProgressCallback m_callback;

    QMutex m_mutex;
    QWaitCondition m_wake;
    bool m_stopRequested = false;
    QByteArray m_partialLine;   // bytes after the last newline, completed by the next poll
};

// Owns the progress channel handed to the encoder ("-progress <path>") and
// the thread polling it. Single use: Idle -> Running -> Stopped. The
// destructor stops it, so scoping the monitor to the encode call guarantees
// the thread is joined and the channel removed on every exit path.
class ProgressMonitor : public QObject {
    Q_OBJECT
public:
    enum class State {
        Idle,
        Running,
        Stopped
    };

    ProgressMonitor(double expectedDurationSeconds, ProgressCallback callback,
                    QObject* parent = nullptr);
    ~ProgressMonitor();

    void setPollInterval(int intervalMs) { m_pollIntervalMs = intervalMs; }
    int pollInterval() const { return m_pollIntervalMs; }

    bool start();
    void stop();

    State state() const { return m_state; }
    QString channelPath() const { return m_channelPath; }
    QString errorString() const { return m_error; }

    // Newest numeric out_time_ms value (microseconds) among complete lines
    static bool parseLatestOutTime(const QByteArray& lines, qint64& outTimeUs);

private:
    double m_expectedSeconds;
    ProgressCallback m_callback;
    int m_pollIntervalMs;

    State m_state = State::Idle;
    QString m_channelPath;
    QString m_error;
    std::unique_ptr<QTemporaryFile> m_channel;
    std::unique_ptr<ProgressPollThread> m_thread;
};
