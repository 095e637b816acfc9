#pragma once

#include <QString>
#include <QDateTime>
#include <QEventLoop>
#include <QTimer>

namespace TimeUtil {

// Video length for log lines: 1:02:03 or 2:03
inline QString formatDuration(double totalSeconds) {
    const int whole = static_cast<int>(totalSeconds + 0.5);
    const int hours = whole / 3600;
    const QString mmss = QString("%1:%2")
        .arg((whole / 60) % 60, hours > 0 ? 2 : 1, 10, QChar('0'))
        .arg(whole % 60, 2, 10, QChar('0'));
    return hours > 0 ? QString("%1:%2").arg(hours).arg(mmss) : mmss;
}

// Sequential frame file name: frame-000042.jpg
inline QString frameFileName(int index) {
    return QString("frame-%1.jpg").arg(index, 6, 10, QChar('0'));
}

inline qint64 epochMillis() {
    return QDateTime::currentMSecsSinceEpoch();
}

// Sleeps while still delivering events (socket traffic keeps flowing).
inline void wait(int ms) {
    if (ms <= 0) return;
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

} // namespace TimeUtil
