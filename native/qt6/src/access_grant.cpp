#include "access_grant.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QUuid>

QString ProbeAccessGrantProvider::key(const QString& path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

bool ProbeAccessGrantProvider::probe(const QString& path)
{
    QFileInfo fi(path);
    if (!fi.exists()) {
        qDebug() << "[AccessGrant] Path doesn't exist:" << path;
        return false;
    }

    if (fi.isDir()) {
        QDir dir(path);
        if (!dir.isReadable()) {
            qDebug() << "[AccessGrant] Cannot list directory:" << path;
            return false;
        }
        dir.entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);

        const QString probePath = dir.filePath(QStringLiteral(".koffload-probe-%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces)));
        QFile probeFile(probePath);
        if (!probeFile.open(QIODevice::WriteOnly)) {
            qDebug() << "[AccessGrant] Read-only access to directory:" << path;
            return false;
        }
        probeFile.close();
        if (!probeFile.remove()) {
            qWarning() << "[AccessGrant] Could not remove probe file" << probePath << probeFile.errorString();
        }
        return true;
    }

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qDebug() << "[AccessGrant] Cannot open file:" << path << f.errorString();
        return false;
    }
    if (f.size() == 0) return true;
    char byte = 0;
    return f.read(&byte, 1) == 1;
}

bool ProbeAccessGrantProvider::hasAccess(const QString& path)
{
    const QString k = key(path);
    {
        QMutexLocker lk(&m_mutex);
        if (m_granted.value(k, false)) return true;
    }
    const bool ok = probe(path);
    if (ok) {
        QMutexLocker lk(&m_mutex);
        m_granted.insert(k, true);
    }
    return ok;
}

bool ProbeAccessGrantProvider::requestAccess(const QString& path)
{
    RequestHandler handler;
    {
        QMutexLocker lk(&m_mutex);
        m_granted.remove(key(path));
        handler = m_requestHandler;
    }
    if (handler && !handler(path)) {
        qInfo() << "[AccessGrant] Access request declined for" << path;
        return false;
    }
    return probe(path);
}

void ProbeAccessGrantProvider::revokeAll()
{
    QMutexLocker lk(&m_mutex);
    m_granted.clear();
}

void ProbeAccessGrantProvider::setRequestHandler(RequestHandler handler)
{
    QMutexLocker lk(&m_mutex);
    m_requestHandler = std::move(handler);
}

namespace AccessGrant {

bool ensure(AccessGrantProvider* provider, const QString& path)
{
    if (!provider) return true;
    if (provider->hasAccess(path)) return true;
    if (!provider->requestAccess(path)) return false;
    return provider->hasAccess(path);
}

}
