#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include "../src/xxhash64.h"

class TestXXHash64 : public QObject {
    Q_OBJECT
private slots:
    void testReferenceVectors_data();
    void testReferenceVectors();
    void testSanityBuffer_data();
    void testSanityBuffer();
    void testChunkingInvariance();
    void testSingleByteChanges();
    void testFinalizeIsRepeatable();
    void testHashFile();
    void testToHex();
};

// Buffer generator used by the reference xxhsum self test
static QByteArray sanityBuffer(int length)
{
    QByteArray buf(length, 0);
    quint64 gen = 2654435761U;
    for (int i = 0; i < length; ++i) {
        buf[i] = char(uchar(gen >> 24));
        gen *= gen;
    }
    return buf;
}

void TestXXHash64::testReferenceVectors_data()
{
    QTest::addColumn<QByteArray>("input");
    QTest::addColumn<quint64>("expected");

    QTest::newRow("empty") << QByteArray() << Q_UINT64_C(0xEF46DB3751D8E999);
    QTest::newRow("a") << QByteArray("a") << Q_UINT64_C(0xD24EC4F1A98C6E5B);
    QTest::newRow("abc") << QByteArray("abc") << Q_UINT64_C(0x44BC2CF5AD770999);
    QTest::newRow("fox") << QByteArray("The quick brown fox jumps over the lazy dog") << Q_UINT64_C(0x0B242D361FDA71BC);
    QTest::newRow("spammish") << QByteArray("Nobody inspects the spammish repetition") << Q_UINT64_C(0xFBCEA83C8A378BF1);
}

void TestXXHash64::testReferenceVectors()
{
    QFETCH(QByteArray, input);
    QFETCH(quint64, expected);
    QCOMPARE(XXHash64::hash(input), expected);
}

void TestXXHash64::testSanityBuffer_data()
{
    QTest::addColumn<int>("length");
    QTest::addColumn<quint64>("seed");
    QTest::addColumn<quint64>("expected");

    const quint64 prime = 2654435761U;
    QTest::newRow("0/0") << 0 << quint64(0) << Q_UINT64_C(0xEF46DB3751D8E999);
    QTest::newRow("0/prime") << 0 << prime << Q_UINT64_C(0xAC75FDA2929B17EF);
    QTest::newRow("1/0") << 1 << quint64(0) << Q_UINT64_C(0x4FCE394CC88952D8);
    QTest::newRow("1/prime") << 1 << prime << Q_UINT64_C(0x739840CB819FA723);
    QTest::newRow("14/0") << 14 << quint64(0) << Q_UINT64_C(0xCFFA8DB881BC3A3D);
    QTest::newRow("14/prime") << 14 << prime << Q_UINT64_C(0x5B9611585EFCC9CB);
    QTest::newRow("101/0") << 101 << quint64(0) << Q_UINT64_C(0x0EAB543384F878AD);
    QTest::newRow("101/prime") << 101 << prime << Q_UINT64_C(0xCAA65939306F1E21);
}

void TestXXHash64::testSanityBuffer()
{
    QFETCH(int, length);
    QFETCH(quint64, seed);
    QFETCH(quint64, expected);
    QCOMPARE(XXHash64::hash(sanityBuffer(length), seed), expected);
}

void TestXXHash64::testChunkingInvariance()
{
    const QByteArray data = sanityBuffer(1000);
    const quint64 whole = XXHash64::hash(data, 7);

    // Every split point, including splits inside and across stripes
    for (int split = 0; split <= data.size(); split += 3) {
        XXHash64 h(7);
        h.update(data.constData(), split);
        h.update(data.constData() + split, data.size() - split);
        QCOMPARE(h.finalize(), whole);
    }

    // Odd sized pieces, and empty updates in between
    for (int piece : {1, 5, 31, 32, 33, 64, 127}) {
        XXHash64 h(7);
        for (int pos = 0; pos < data.size(); pos += piece) {
            h.update(data.constData() + pos, qMin<int>(piece, data.size() - pos));
            h.update(nullptr, 0);
        }
        QCOMPARE(h.finalize(), whole);
        QCOMPARE(h.totalLength(), quint64(data.size()));
    }
}

void TestXXHash64::testSingleByteChanges()
{
    const QByteArray base = sanityBuffer(200);
    const quint64 reference = XXHash64::hash(base);
    QSet<quint64> seen{reference};
    for (int i = 0; i < base.size(); i += 7) {
        for (int bit = 0; bit < 8; ++bit) {
            QByteArray flipped = base;
            flipped[i] = char(flipped[i] ^ (1 << bit));
            const quint64 d = XXHash64::hash(flipped);
            QVERIFY2(d != reference, qPrintable(QString("byte %1 bit %2").arg(i).arg(bit)));
            seen.insert(d);
        }
    }
    // No two single-bit variants collide either
    QCOMPARE(seen.size(), 1 + ((base.size() + 6) / 7) * 8);
}

void TestXXHash64::testFinalizeIsRepeatable()
{
    XXHash64 h;
    h.update(QByteArray("hello world, this is longer than one stripe"));
    const quint64 first = h.finalize();
    QCOMPARE(h.finalize(), first);

    h.reset();
    QCOMPARE(h.finalize(), Q_UINT64_C(0xEF46DB3751D8E999));
    QCOMPARE(h.totalLength(), quint64(0));
}

void TestXXHash64::testHashFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    // Larger than one file chunk so the streaming path crosses a buffer boundary
    const QByteArray data = sanityBuffer(int(XXHash64::FileChunkSize) + 4097);
    const QString path = dir.filePath("clip.bin");
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    QCOMPARE(f.write(data), qint64(data.size()));
    f.close();

    quint64 digest = 0;
    QVERIFY(XXHash64::hashFile(path, digest, 42));
    QCOMPARE(digest, XXHash64::hash(data, 42));

    QVERIFY(!XXHash64::hashFile(dir.filePath("missing.bin"), digest));
}

void TestXXHash64::testToHex()
{
    QCOMPARE(XXHash64::toHex(Q_UINT64_C(0x44BC2CF5AD770999)), QString("44bc2cf5ad770999"));
    QCOMPARE(XXHash64::toHex(Q_UINT64_C(0x0B242D361FDA71BC)), QString("0b242d361fda71bc"));
    QCOMPARE(XXHash64::toHex(0), QString("0000000000000000"));
}

QTEST_APPLESS_MAIN(TestXXHash64)
#include "test_xxhash64.moc"
