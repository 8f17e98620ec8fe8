#include "ConsoleProgress.h"
#include "TimeUtil.h"
#include <QIODevice>
#include <QMutexLocker>

ConsoleProgress::ConsoleProgress(QIODevice* out, int barWidth)
    : m_out(out), m_barWidth(barWidth) {}

void ConsoleProgress::update(const QString& label, double fraction) {
    QMutexLocker lock(&m_mutex);
    if (m_lineOpen && label != m_label)
        endLine();

    fraction = qBound(0.0, fraction, 1.0);
    const int filled = static_cast<int>(fraction * m_barWidth);
    const QByteArray bar = QByteArray(filled, '#') + QByteArray(m_barWidth - filled, '-');
    const QString line = QString("\r%1 [%2] Progress: %3")
                             .arg(label, -10)
                             .arg(QString::fromLatin1(bar), TimeUtil::fractionToPercent(fraction));
    m_out->write(line.toUtf8());
    m_lineOpen = true;
    m_label = label;
}

void ConsoleProgress::finish() {
    QMutexLocker lock(&m_mutex);
    if (m_lineOpen)
        endLine();
}

void ConsoleProgress::endLine() {
    m_out->write("\n");
    m_lineOpen = false;
}
