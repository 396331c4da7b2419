#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include "../src/checksum.h"
#include "../src/transfer_task.h"

class TestChecksum : public QObject {
    Q_OBJECT
private slots:
    void testNames();
    void testBytesHex();
    void testFileHexMatchesBytesHex();
    void testFileHexFailures();
    void testMatches();
};

static QString writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& data)
{
    const QString path = dir.filePath(name);
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) f.write(data);
    return path;
}

void TestChecksum::testNames()
{
    QCOMPARE(Checksum::tagName(ChecksumAlgorithm::Md5), QString("md5"));
    QCOMPARE(Checksum::tagName(ChecksumAlgorithm::Sha1), QString("sha1"));
    QCOMPARE(Checksum::tagName(ChecksumAlgorithm::XxHash64), QString("xxh64"));
    QCOMPARE(Checksum::displayName(ChecksumAlgorithm::XxHash64), QString("xxHash64"));
    QCOMPARE(Checksum::tagNames().size(), 3);

    ChecksumAlgorithm alg = ChecksumAlgorithm::Md5;
    QVERIFY(Checksum::fromName("SHA1", alg));
    QCOMPARE(alg, ChecksumAlgorithm::Sha1);
    QVERIFY(Checksum::fromName("xxHash64", alg));
    QCOMPARE(alg, ChecksumAlgorithm::XxHash64);
    QVERIFY(Checksum::fromName(" md5 ", alg));
    QCOMPARE(alg, ChecksumAlgorithm::Md5);
    QVERIFY(!Checksum::fromName("crc32", alg));
    QCOMPARE(alg, ChecksumAlgorithm::Md5);
}

void TestChecksum::testBytesHex()
{
    const QByteArray abc("abc");
    QCOMPARE(Checksum::bytesHex(abc, ChecksumAlgorithm::Md5), QString("900150983cd24fb0d6963f7d28e17f72"));
    QCOMPARE(Checksum::bytesHex(abc, ChecksumAlgorithm::Sha1), QString("a9993e364706816aba3e25717850c26c9cd0d89d"));
    QCOMPARE(Checksum::bytesHex(abc, ChecksumAlgorithm::XxHash64), QString("44bc2cf5ad770999"));
    QCOMPARE(Checksum::bytesHex(QByteArray(), ChecksumAlgorithm::Md5), QString("d41d8cd98f00b204e9800998ecf8427e"));
}

void TestChecksum::testFileHexMatchesBytesHex()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QByteArray data;
    for (int i = 0; i < 10000; ++i) data.append(char(i * 31 + 7));
    const QString path = writeFile(dir, "A001.mov", data);

    for (ChecksumAlgorithm alg : {ChecksumAlgorithm::Md5, ChecksumAlgorithm::Sha1, ChecksumAlgorithm::XxHash64}) {
        const QString expected = Checksum::bytesHex(data, alg);
        QCOMPARE(Checksum::fileHex(path, alg), expected);
        // Chunk size must not change the digest
        QCOMPARE(Checksum::fileHex(path, alg, nullptr, 7), expected);
        QCOMPARE(Checksum::fileHex(path, alg, nullptr, 4096), expected);
    }
}

void TestChecksum::testFileHexFailures()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QCOMPARE(Checksum::fileHex(dir.filePath("nope.mov"), ChecksumAlgorithm::Md5), QString());

    const QString path = writeFile(dir, "B001.mov", QByteArray(1000, 'x'));
    TransferControl control;
    control.cancel();
    QCOMPARE(Checksum::fileHex(path, ChecksumAlgorithm::Md5, &control), QString());
}

void TestChecksum::testMatches()
{
    QVERIFY(Checksum::matches("ABCDEF", "abcdef"));
    QVERIFY(!Checksum::matches("abcdef", "abcdee"));
    QVERIFY(!Checksum::matches(QString(), QString()));
    QVERIFY(!Checksum::matches("abc", QString()));
}

QTEST_APPLESS_MAIN(TestChecksum)
#include "test_checksum.moc"
