#include "ProgressMonitor.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <QTemporaryFile>

namespace {

bool isDigits(const QByteArray& text) {
    if (text.isEmpty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

// --- ProgressPollThread ---

ProgressPollThread::ProgressPollThread(const QString& channelPath, double expectedSeconds,
                                       int intervalMs, ProgressCallback callback, QObject* parent)
    : QThread(parent)
    , m_channelPath(channelPath)
    , m_expectedSeconds(expectedSeconds)
    , m_intervalMs(intervalMs)
    , m_callback(std::move(callback)) {}

void ProgressPollThread::requestStop() {
    QMutexLocker lock(&m_mutex);
    m_stopRequested = true;
    m_wake.wakeAll();
}

void ProgressPollThread::run() {
    QFile channel(m_channelPath);
    if (!channel.open(QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        qCWarning(lcProgress) << "Cannot read progress channel" << m_channelPath;
    }

    QMutexLocker lock(&m_mutex);
    while (!m_stopRequested) {
        lock.unlock();
        if (channel.isOpen()) {
            poll(channel);
        }
        lock.relock();

        if (!m_stopRequested) {
            m_wake.wait(&m_mutex, static_cast<unsigned long>(m_intervalMs));
        }
    }
}

void ProgressPollThread::poll(QFile& channel) {
    QByteArray chunk = channel.readAll();
    if (chunk.isEmpty()) return;

    QByteArray text = m_partialLine + chunk;
    const auto lastNewline = text.lastIndexOf('\n');
    if (lastNewline < 0) {
        m_partialLine = text;
        return;
    }
    m_partialLine = text.mid(lastNewline + 1);
    text.truncate(lastNewline + 1);

    qint64 outTimeUs = 0;
    if (!ProgressMonitor::parseLatestOutTime(text, outTimeUs)) return;
    if (m_expectedSeconds <= 0.0) return;

    const double seconds = static_cast<double>(outTimeUs) / AppConstants::MicrosecondsPerSecond;
    const double fraction = seconds / m_expectedSeconds;
    qCDebug(lcProgress) << "Encoded" << seconds << "of" << m_expectedSeconds << "s";

    if (m_callback) {
        m_callback(fraction);
    }
}

// --- ProgressMonitor ---

ProgressMonitor::ProgressMonitor(double expectedDurationSeconds, ProgressCallback callback,
                                 QObject* parent)
    : QObject(parent)
    , m_expectedSeconds(expectedDurationSeconds)
    , m_callback(std::move(callback))
    , m_pollIntervalMs(AppConstants::ProgressPollIntervalMs) {}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

bool ProgressMonitor::start() {
    if (m_state != State::Idle) {
        m_error = "Progress monitor can only be started once";
        return false;
    }

    m_channel = std::make_unique<QTemporaryFile>(
        QDir(QDir::tempPath()).filePath("reelforge-progress-XXXXXX.txt"));
    if (!m_channel->open()) {
        m_error = QString("Cannot create progress channel: %1").arg(m_channel->errorString());
        m_channel.reset();
        return false;
    }
    // The encoder writes through its own handle; only the path is shared
    m_channelPath = m_channel->fileName();
    m_channel->close();

    m_thread = std::make_unique<ProgressPollThread>(m_channelPath, m_expectedSeconds,
                                                    m_pollIntervalMs, m_callback);
    m_thread->start();
    m_state = State::Running;

    qCDebug(lcProgress) << "Polling" << m_channelPath << "every" << m_pollIntervalMs << "ms";
    return true;
}

void ProgressMonitor::stop() {
    if (m_state == State::Stopped) return;

    if (m_thread) {
        m_thread->requestStop();
        m_thread->wait();
        m_thread.reset();
    }
    m_channel.reset();   // removes the channel file
    m_state = State::Stopped;
}

bool ProgressMonitor::parseLatestOutTime(const QByteArray& lines, qint64& outTimeUs) {
    bool found = false;
    const QList<QByteArray> parts = lines.split('\n');
    for (const QByteArray& raw : parts) {
        const QByteArray line = raw.trimmed();
        const auto eq = line.indexOf('=');
        if (eq < 0) continue;
        if (line.left(eq).trimmed() != "out_time_ms") continue;

        const QByteArray value = line.mid(eq + 1).trimmed();
        if (!isDigits(value)) continue;

        bool ok = false;
        const qint64 parsed = value.toLongLong(&ok);
        if (ok) {
            outTimeUs = parsed;
            found = true;
        }
    }
    return found;
}
