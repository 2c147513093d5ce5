/**
 * @file test_ftplistingparser.cpp
 * @brief Unit tests for FtpListingParser (LIST output, MDTM stamps, paths).
 */

#include <QtTest>

#include "services/ftplistingparser.h"

class TestFtpListingParser : public QObject
{
    Q_OBJECT

private slots:
    // === Unix listings ===

    void parse_unixFileAndDirectory()
    {
        const QByteArray listing =
            "total 12\r\n"
            "drwxr-xr-x    2 ftp      ftp          4096 Jan 15 10:30 music\r\n"
            "-rw-r--r--    1 ftp      ftp         174848 Mar  1  2021 game.d64\r\n";

        const RemoteListing entries = FtpListingParser::parse(listing);

        QCOMPARE(entries.size(), 2);
        QCOMPARE(entries.at(0).name, QString("music"));
        QVERIFY(entries.at(0).isDirectory());
        QCOMPARE(entries.at(0).size, qint64(0));
        QCOMPARE(entries.at(0).permissions, QString("rwxr-xr-x"));

        QCOMPARE(entries.at(1).name, QString("game.d64"));
        QVERIFY(entries.at(1).isFile());
        QCOMPARE(entries.at(1).size, qint64(174848));
        QCOMPARE(entries.at(1).owner, QString("ftp"));
        QCOMPARE(entries.at(1).group, QString("ftp"));
        QCOMPARE(entries.at(1).timestampText, QString("Mar 1 2021"));
        QCOMPARE(entries.at(1).modified.date(), QDate(2021, 3, 1));
    }

    void parse_nameWithSpaces()
    {
        const RemoteListing entries = FtpListingParser::parse(
            "-rw-r--r-- 1 user group 100 Jan  1 12:00 My Document.txt\n");

        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.first().name, QString("My Document.txt"));
    }

    void parse_withoutGroupColumn()
    {
        const RemoteListing entries = FtpListingParser::parse(
            "-rw-r--r-- 1 owner 2048 Feb 10 2023 notes.txt\n");

        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.first().name, QString("notes.txt"));
        QCOMPARE(entries.first().size, qint64(2048));
        QCOMPARE(entries.first().owner, QString("owner"));
        QVERIFY(entries.first().group.isEmpty());
    }

    void parse_symlink()
    {
        const RemoteListing entries = FtpListingParser::parse(
            "lrwxrwxrwx 1 root root 11 Jun  5  2020 latest -> release-2.1\n");

        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.first().kind, FtpEntry::Kind::Symlink);
        QCOMPARE(entries.first().name, QString("latest"));
        QCOMPARE(entries.first().linkTarget, QString("release-2.1"));
    }

    void parse_skipsDotEntries()
    {
        const RemoteListing entries = FtpListingParser::parse(
            "drwxr-xr-x 2 ftp ftp 4096 Jan 15 10:30 .\r\n"
            "drwxr-xr-x 2 ftp ftp 4096 Jan 15 10:30 ..\r\n"
            "-rw-r--r-- 1 ftp ftp 5 Jan 15 10:30 .hidden\r\n");

        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.first().name, QString(".hidden"));
    }

    void parse_recentTimestampIsNotInFuture()
    {
        const RemoteListing entries = FtpListingParser::parse(
            "-rw-r--r-- 1 ftp ftp 5 Jan  1 00:00 a.txt\n");

        QCOMPARE(entries.size(), 1);
        QVERIFY(entries.first().modified.isValid());
        QVERIFY(entries.first().modified <= QDateTime::currentDateTimeUtc().addDays(1));
    }

    // === DOS / IIS listings ===

    void parse_dosListing()
    {
        const RemoteListing entries = FtpListingParser::parse(
            "01-15-24  10:30AM       <DIR>          folder\r\n"
            "01-15-24  02:05PM                 1234 file.txt\r\n");

        QCOMPARE(entries.size(), 2);
        QVERIFY(entries.at(0).isDirectory());
        QCOMPARE(entries.at(0).name, QString("folder"));
        QVERIFY(entries.at(1).isFile());
        QCOMPARE(entries.at(1).size, qint64(1234));
        QCOMPARE(entries.at(1).modified, QDateTime(QDate(2024, 1, 15), QTime(14, 5), QTimeZone::utc()));
    }

    // === Fallbacks ===

    void parse_nameOnlyLines()
    {
        const RemoteListing entries = FtpListingParser::parse("alpha\r\nbeta\r\n\r\n");

        QCOMPARE(entries.size(), 2);
        QCOMPARE(entries.at(0).name, QString("alpha"));
        QCOMPARE(entries.at(0).kind, FtpEntry::Kind::Unknown);
        QCOMPARE(entries.at(1).name, QString("beta"));
    }

    void parse_empty()
    {
        QVERIFY(FtpListingParser::parse(QByteArray()).isEmpty());
        QVERIFY(FtpListingParser::parse("total 0\r\n").isEmpty());
    }

    // === MDTM ===

    void parseModificationTime_valid()
    {
        const QDateTime time = FtpListingParser::parseModificationTime("20240115103000");
        QCOMPARE(time, QDateTime(QDate(2024, 1, 15), QTime(10, 30, 0), QTimeZone::utc()));
    }

    void parseModificationTime_withFraction()
    {
        const QDateTime time = FtpListingParser::parseModificationTime("20231231235959.123");
        QCOMPARE(time, QDateTime(QDate(2023, 12, 31), QTime(23, 59, 59), QTimeZone::utc()));
    }

    void parseModificationTime_invalid_data()
    {
        QTest::addColumn<QString>("message");

        QTest::newRow("empty") << "";
        QTest::newRow("too short") << "2024011510";
        QTest::newRow("bad month") << "20241315103000";
        QTest::newRow("text") << "File unavailable";
    }

    void parseModificationTime_invalid()
    {
        QFETCH(QString, message);
        QVERIFY(!FtpListingParser::parseModificationTime(message).isValid());
    }

    // === Paths ===

    void normalizePath_data()
    {
        QTest::addColumn<QString>("input");
        QTest::addColumn<QString>("expected");

        QTest::newRow("root") << "/" << "/";
        QTest::newRow("trailing slash") << "/a/b/" << "/a/b";
        QTest::newRow("double slashes") << "//a///b" << "/a/b";
        QTest::newRow("backslashes") << "\\a\\b" << "/a/b";
        QTest::newRow("relative") << "a/b/" << "a/b";
    }

    void normalizePath()
    {
        QFETCH(QString, input);
        QFETCH(QString, expected);
        QCOMPARE(FtpListingParser::normalizePath(input), expected);
    }

    void parentDirectory_data()
    {
        QTest::addColumn<QString>("input");
        QTest::addColumn<QString>("expected");

        QTest::newRow("nested") << "/a/b/c" << "/a/b";
        QTest::newRow("top level") << "/a" << "/";
        QTest::newRow("root") << "/" << "/";
        QTest::newRow("trailing slash") << "/a/b/" << "/a";
        QTest::newRow("relative") << "file.txt" << "/";
    }

    void parentDirectory()
    {
        QFETCH(QString, input);
        QFETCH(QString, expected);
        QCOMPARE(FtpListingParser::parentDirectory(input), expected);
    }

    void baseNameAndJoin()
    {
        QCOMPARE(FtpListingParser::baseName("/a/b/file.txt"), QString("file.txt"));
        QCOMPARE(FtpListingParser::baseName("/a/b/"), QString("b"));
        QCOMPARE(FtpListingParser::baseName("/"), QString());

        QCOMPARE(FtpListingParser::joinPath("/a", "b"), QString("/a/b"));
        QCOMPARE(FtpListingParser::joinPath("/", "b"), QString("/b"));
        QCOMPARE(FtpListingParser::joinPath("", "b"), QString("b"));
    }
};

QTEST_MAIN(TestFtpListingParser)
#include "test_ftplistingparser.moc"
