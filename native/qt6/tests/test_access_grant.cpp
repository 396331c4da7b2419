#include <QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include "../src/access_grant.h"

// Grants only after requestAccess() was called once for the path
class PromptingProvider : public AccessGrantProvider {
public:
    bool hasAccess(const QString& path) override { ++queries; return granted.contains(path); }
    bool requestAccess(const QString& path) override
    {
        ++requests;
        if (!allow) return false;
        granted.insert(path);
        return true;
    }
    void revokeAll() override { granted.clear(); }

    QSet<QString> granted;
    bool allow = true;
    int queries = 0;
    int requests = 0;
};

class TestAccessGrant : public QObject {
    Q_OBJECT
private slots:
    void testProbeDirectoryLeavesNoTrace();
    void testProbeFiles();
    void testProbeMissingPath();
    void testRequestHandler();
    void testEnsureQueriesAgainAfterGrant();
    void testEnsureWithoutProvider();
};

void TestAccessGrant::testProbeDirectoryLeavesNoTrace()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(ProbeAccessGrantProvider::probe(dir.path()));
    const QStringList left = QDir(dir.path()).entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden);
    QVERIFY2(left.isEmpty(), qPrintable(left.join(", ")));
}

void TestAccessGrant::testProbeFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString media = dir.filePath("C0001.MP4");
    QFile f(media);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("data");
    f.close();
    QVERIFY(ProbeAccessGrantProvider::probe(media));

    const QString empty = dir.filePath("empty.jpg");
    QFile(empty).open(QIODevice::WriteOnly);
    QVERIFY(ProbeAccessGrantProvider::probe(empty));
}

void TestAccessGrant::testProbeMissingPath()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ProbeAccessGrantProvider provider;
    QVERIFY(!provider.hasAccess(dir.filePath("gone")));
    QVERIFY(provider.hasAccess(dir.path()));
}

void TestAccessGrant::testRequestHandler()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ProbeAccessGrantProvider provider;
    QStringList asked;
    provider.setRequestHandler([&asked](const QString& path) { asked << path; return false; });
    QVERIFY(!provider.requestAccess(dir.path()));
    QCOMPARE(asked.size(), 1);

    provider.setRequestHandler([](const QString&) { return true; });
    QVERIFY(provider.requestAccess(dir.path()));
    provider.revokeAll();
    QVERIFY(provider.hasAccess(dir.path()));
}

void TestAccessGrant::testEnsureQueriesAgainAfterGrant()
{
    PromptingProvider provider;
    QVERIFY(AccessGrant::ensure(&provider, "/media/card"));
    QCOMPARE(provider.requests, 1);
    QCOMPARE(provider.queries, 2);

    // Granted now; no second prompt
    QVERIFY(AccessGrant::ensure(&provider, "/media/card"));
    QCOMPARE(provider.requests, 1);

    provider.revokeAll();
    provider.allow = false;
    QVERIFY(!AccessGrant::ensure(&provider, "/media/card"));
    QCOMPARE(provider.requests, 2);
}

void TestAccessGrant::testEnsureWithoutProvider()
{
    QVERIFY(AccessGrant::ensure(nullptr, "/anything"));
}

QTEST_APPLESS_MAIN(TestAccessGrant)
#include "test_access_grant.moc"
