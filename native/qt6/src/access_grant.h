#pragma once
#include <QHash>
#include <QMutex>
#include <QString>
#include <functional>

/**
 * AccessGrantProvider - answers whether the process may touch a path.
 *
 * The engine asks hasAccess() before reading or writing a path. On a negative
 * answer it may call requestAccess() (which can be interactive) and must query
 * hasAccess() again afterwards. Grants are never assumed to outlive the session.
 */
class AccessGrantProvider {
public:
    virtual ~AccessGrantProvider() = default;

    virtual bool hasAccess(const QString& path) = 0;
    virtual bool requestAccess(const QString& path) = 0;
    virtual void revokeAll() = 0;
};

/**
 * ProbeAccessGrantProvider - grants access to paths that pass a capability probe.
 *
 * Directories must list and accept a zero-byte probe file, which is created and
 * deleted again. Regular files must yield one readable byte. The probe therefore
 * writes into directories it checks. Positive results are cached per session.
 */
class ProbeAccessGrantProvider : public AccessGrantProvider {
public:
    // Stand-in for the interactive prompt; returns true if the user granted access
    using RequestHandler = std::function<bool(const QString& path)>;

    ProbeAccessGrantProvider() = default;

    bool hasAccess(const QString& path) override;
    bool requestAccess(const QString& path) override;
    void revokeAll() override;

    void setRequestHandler(RequestHandler handler);

    // Runs the probe without touching the cache
    static bool probe(const QString& path);

private:
    static QString key(const QString& path);

    QMutex m_mutex;
    QHash<QString, bool> m_granted;
    RequestHandler m_requestHandler;
};

namespace AccessGrant {
// Query, request on refusal, then query again
bool ensure(AccessGrantProvider* provider, const QString& path);
}
