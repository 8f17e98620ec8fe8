#pragma once

#include <QMutex>
#include <QString>

class QIODevice;

// Single-line progress bar redrawn in place with '\r'. The line is ended
// once, by finish() or by the next update that carries another label.
class ConsoleProgress {
public:
    explicit ConsoleProgress(QIODevice* out, int barWidth = 40);

    void update(const QString& label, double fraction);
    void finish();

private:
    void endLine();

    QIODevice* m_out;
    int m_barWidth;
    bool m_lineOpen = false;
    QString m_label;
    QMutex m_mutex;
};
