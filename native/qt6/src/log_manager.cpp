#include "log_manager.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <cstdio>
#include <cstdlib>

namespace {

// QtInfoMsg has a larger enum value than QtWarningMsg; rank by severity instead
int severity(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg: return 0;
        case QtInfoMsg: return 1;
        case QtWarningMsg: return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg: return 4;
    }
    return 0;
}

bool flushesImmediately(const QString& level)
{
    return level == QLatin1String("WARN") || level == QLatin1String("ERROR") || level == QLatin1String("FATAL");
}

}

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(kFlushIntervalMs);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);

    setLogFilePath(QCoreApplication::applicationDirPath() + "/app.log");
    qInstallMessageHandler(customMessageHandler);
}

LogManager::~LogManager() {
    flushPending();
}

QString LogManager::levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return QStringLiteral("DEBUG");
        case QtInfoMsg: return QStringLiteral("INFO");
        case QtWarningMsg: return QStringLiteral("WARN");
        case QtCriticalMsg: return QStringLiteral("ERROR");
        case QtFatalMsg: return QStringLiteral("FATAL");
    }
    return QStringLiteral("INFO");
}

QString LogManager::formatEntry(const QString& level, const QString& message) {
    return QStringLiteral("[%1] [%2] %3")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss.zzz")), level, message);
}

bool LogManager::setLogFilePath(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    m_file.close();
    m_pendingFlush = false;
    if (path.isEmpty()) return true;

    QDir().mkpath(QFileInfo(path).absolutePath());
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "[LogManager] Cannot open log file %s\n", qPrintable(path));
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    return true;
}

QString LogManager::logFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_file.isOpen() ? m_file.fileName() : QString();
}

bool LogManager::echoesToStderr(QtMsgType type) const {
    return severity(type) >= severity(QtMsgType(m_stderrThreshold.load()));
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

void LogManager::addLog(const QString& message, const QString& level) {
    const QString upper = level.toUpper();
    const QString entry = formatEntry(upper, message);
    bool flushNow = false;
    {
        QMutexLocker locker(&m_mutex);
        m_logs.append(entry);
        while (m_logs.size() > kMaxLogs) m_logs.removeFirst();
        if (m_ts.device()) {
            m_ts << entry << '\n';
            m_pendingFlush = true;
            flushNow = flushesImmediately(upper);
        }
    }

    emit logsChanged();
    emit logAdded(entry);

    if (flushNow) flushPending();
    else if (!m_flushTimer.isActive()) m_flushTimer.start();
}

void LogManager::flushPending() {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device() && m_pendingFlush) m_ts.flush();
    m_pendingFlush = false;
}

void LogManager::clear() {
    {
        QMutexLocker locker(&m_mutex);
        m_logs.clear();
    }
    emit logsChanged();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    const QString level = LogManager::levelName(type);
    LogManager& lm = LogManager::instance();

    QMetaObject::invokeMethod(&lm, [level, msg]() {
        LogManager::instance().addLog(msg, level);
    }, Qt::QueuedConnection);

    if (lm.echoesToStderr(type)) {
        std::fprintf(stderr, "%s\n", qPrintable(LogManager::formatEntry(level, msg)));
        std::fflush(stderr);
    }

    if (type == QtFatalMsg) {
        std::abort();
    }
}
