#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <QTimer>
#include <atomic>

/**
 * LogManager - in-memory ring of recent log lines plus a write-through log file.
 *
 * Every qDebug/qInfo/qWarning/qCritical line reaches it through
 * customMessageHandler, which may run on any thread; the line is handed to
 * the LogManager thread with a queued call. WARN and above are flushed to
 * disk at once, the rest within kFlushIntervalMs.
 *
 * Line format: "[hh:mm:ss.zzz] [LEVEL] message"
 */
class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;

    void addLog(const QString& message, const QString& level = "INFO");
    void clear();

    // Reopens the sink at path (append mode). Empty path disables the file sink.
    bool setLogFilePath(const QString& path);
    QString logFilePath() const;

    // Lowest level mirrored to stderr by customMessageHandler
    void setStderrThreshold(QtMsgType type) { m_stderrThreshold.store(int(type)); }
    bool echoesToStderr(QtMsgType type) const;

    static QString levelName(QtMsgType type);
    static QString formatEntry(const QString& level, const QString& message);

signals:
    void logsChanged();
    void logAdded(const QString& entry);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    std::atomic_int m_stderrThreshold{int(QtDebugMsg)};
    static constexpr int kMaxLogs = 1000;
    static constexpr int kFlushIntervalMs = 250;
};

// Installed with qInstallMessageHandler; routes Qt messages into LogManager
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
