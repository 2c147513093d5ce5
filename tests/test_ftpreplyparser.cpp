/**
 * @file test_ftpreplyparser.cpp
 * @brief Unit tests for FtpReplyParser line framing and classification.
 *
 * Tests verify:
 * - Lines are reassembled no matter where the read boundaries fall
 * - Multi-line replies yield exactly one terminal line
 * - Malformed lines are reported instead of guessed at
 */

#include <QtTest>

#include "services/ftpreplyparser.h"

class TestFtpReplyParser : public QObject
{
    Q_OBJECT

private:
    // Feeds every line through accept() and returns the terminal ones
    static QList<FtpReplyLine> terminalLines(FtpReplyParser &parser, const QStringList &lines)
    {
        QList<FtpReplyLine> result;
        for (const QString &line : lines) {
            FtpReplyLine reply;
            if (parser.accept(line, &reply) == FtpReplyParser::Result::Terminal) {
                result.append(reply);
            }
        }
        return result;
    }

private slots:
    // === Framing ===

    void feed_singleCompleteLine()
    {
        FtpReplyParser parser;
        const QStringList lines = parser.feed("220 Service ready\r\n");
        QCOMPARE(lines, QStringList{"220 Service ready"});
        QCOMPARE(parser.pendingByteCount(), 0);
    }

    void feed_keepsPartialLine()
    {
        FtpReplyParser parser;
        QVERIFY(parser.feed("220 Serv").isEmpty());
        QCOMPARE(parser.pendingByteCount(), 8);
        QCOMPARE(parser.feed("ice ready\r\n"), QStringList{"220 Service ready"});
    }

    void feed_everySplitPosition()
    {
        const QByteArray stream = "220-Welcome\r\n220 Ready\r\n331 Password required\r\n";

        for (int split = 1; split < stream.size(); ++split) {
            FtpReplyParser parser;
            QStringList lines = parser.feed(stream.left(split));
            lines += parser.feed(stream.mid(split));

            QCOMPARE(lines.size(), 3);
            QCOMPARE(lines.at(0), QString("220-Welcome"));
            QCOMPARE(lines.at(1), QString("220 Ready"));
            QCOMPARE(lines.at(2), QString("331 Password required"));
        }
    }

    void feed_crlfSplitAcrossReads()
    {
        FtpReplyParser parser;
        QVERIFY(parser.feed("200 OK\r").isEmpty());
        QCOMPARE(parser.feed("\n"), QStringList{"200 OK"});
    }

    void feed_byteAtATime()
    {
        const QByteArray stream = "250 Directory changed\r\n";
        FtpReplyParser parser;
        QStringList lines;
        for (char c : stream) {
            lines += parser.feed(QByteArray(1, c));
        }
        QCOMPARE(lines, QStringList{"250 Directory changed"});
    }

    void feed_utf8SplitAcrossReads()
    {
        const QByteArray stream = QString("257 \"/müsik\" created\r\n").toUtf8();
        const int split = stream.indexOf("\xc3") + 1;  // inside the two-byte sequence

        FtpReplyParser parser;
        QVERIFY(parser.feed(stream.left(split)).isEmpty());
        QCOMPARE(parser.feed(stream.mid(split)), QStringList{QString("257 \"/müsik\" created")});
    }

    void feed_skipsEmptyLines()
    {
        FtpReplyParser parser;
        QCOMPARE(parser.feed("\r\n200 OK\r\n\r\n"), QStringList{"200 OK"});
    }

    void reset_dropsPartialLineAndMultiLineState()
    {
        FtpReplyParser parser;
        FtpReplyLine reply;
        QCOMPARE(parser.accept("220-Welcome", &reply), FtpReplyParser::Result::Continuation);
        QVERIFY(parser.feed("230 half").isEmpty());

        parser.reset();

        QVERIFY(!parser.inMultiLineReply());
        QCOMPARE(parser.pendingByteCount(), 0);
        QCOMPARE(parser.feed("200 OK\r\n"), QStringList{"200 OK"});
    }

    // === Classification ===

    void classify_terminalLine()
    {
        FtpReplyLine reply;
        QVERIFY(FtpReplyParser::classify("226 Transfer complete", &reply));
        QCOMPARE(reply.code, 226);
        QVERIFY(reply.isTerminal);
        QCOMPARE(reply.message, QString("Transfer complete"));
        QVERIFY(reply.isSuccess());
    }

    void classify_continuationMarker()
    {
        FtpReplyLine reply;
        QVERIFY(FtpReplyParser::classify("211-Features:", &reply));
        QCOMPARE(reply.code, 211);
        QVERIFY(!reply.isTerminal);
    }

    void classify_bareCode()
    {
        FtpReplyLine reply;
        QVERIFY(FtpReplyParser::classify("200", &reply));
        QCOMPARE(reply.code, 200);
        QVERIFY(reply.isTerminal);
        QVERIFY(reply.message.isEmpty());
    }

    void classify_categories()
    {
        FtpReplyLine reply;
        QVERIFY(FtpReplyParser::classify("150 Opening data connection", &reply));
        QVERIFY(reply.isPreliminary());
        QVERIFY(FtpReplyParser::classify("350 Ready for RNTO", &reply));
        QVERIFY(reply.isSuccess());
        QVERIFY(FtpReplyParser::classify("550 No such file", &reply));
        QVERIFY(reply.isFailure());
    }

    void classify_rejectsMalformed_data()
    {
        QTest::addColumn<QString>("line");

        QTest::newRow("no digits") << "Hello there";
        QTest::newRow("two digits") << "22 Short";
        QTest::newRow("letter in code") << "2a0 Bad";
        QTest::newRow("bad separator") << "220:Colon";
        QTest::newRow("code too low") << "099 Nope";
        QTest::newRow("code too high") << "600 Nope";
    }

    void classify_rejectsMalformed()
    {
        QFETCH(QString, line);
        FtpReplyLine reply;
        QVERIFY(!FtpReplyParser::classify(line, &reply));
    }

    // === Multi-line replies ===

    void accept_multiLineYieldsOneTerminal()
    {
        FtpReplyParser parser;
        const QList<FtpReplyLine> terminals = terminalLines(parser, {
            "220-Welcome to the server",
            "220-Please behave",
            "220 Ready"
        });

        QCOMPARE(terminals.size(), 1);
        QCOMPARE(terminals.first().code, 220);
        QCOMPARE(terminals.first().message, QString("Ready"));
        QVERIFY(!parser.inMultiLineReply());
    }

    void accept_multiLineBodyMayLookLikeReplies()
    {
        // RFC 959 allows arbitrary text inside a multi-line reply, even
        // lines that start with other codes
        FtpReplyParser parser;
        const QList<FtpReplyLine> terminals = terminalLines(parser, {
            "211-Status follows:",
            "200 this is still part of the status",
            " indented text",
            "211- not yet",
            "211 End of status"
        });

        QCOMPARE(terminals.size(), 1);
        QCOMPARE(terminals.first().code, 211);
    }

    void accept_continuationReportsOpeningCode()
    {
        FtpReplyParser parser;
        FtpReplyLine reply;
        QCOMPARE(parser.accept("230-Hello", &reply), FtpReplyParser::Result::Continuation);
        QCOMPARE(parser.accept("free text", &reply), FtpReplyParser::Result::Continuation);
        QCOMPARE(reply.code, 230);
        QVERIFY(!reply.isTerminal);
        QVERIFY(parser.inMultiLineReply());
    }

    void accept_malformedOutsideMultiLine()
    {
        FtpReplyParser parser;
        FtpReplyLine reply;
        QCOMPARE(parser.accept("garbage", &reply), FtpReplyParser::Result::Malformed);
        QVERIFY(!parser.inMultiLineReply());
    }

    void accept_multiLineSplitAcrossReads()
    {
        const QByteArray stream = "230-Welcome\r\n230-Have fun\r\n230 Logged in\r\n";

        for (int split = 1; split < stream.size(); ++split) {
            FtpReplyParser parser;
            QStringList lines = parser.feed(stream.left(split));
            lines += parser.feed(stream.mid(split));

            const QList<FtpReplyLine> terminals = terminalLines(parser, lines);
            QCOMPARE(terminals.size(), 1);
            QCOMPARE(terminals.first().code, 230);
        }
    }

    // === Errors ===

    void error_toStringForServerError()
    {
        FtpReplyLine line;
        QVERIFY(FtpReplyParser::classify("550 No such file", &line));
        const FtpError error = FtpError::fromReply(line).withPath("/x");
        QCOMPARE(error.kind, FtpErrorKind::ServerError);
        QCOMPARE(error.code, 550);
        QCOMPARE(error.toString(), QString("FTP Error 550: No such file (path: /x)"));
    }

    void error_toStringForLocalKinds()
    {
        const FtpError error = FtpError::make(FtpErrorKind::CommandTimeout, "Command timeout: NOOP");
        QCOMPARE(error.toString(), QString("CommandTimeout: Command timeout: NOOP"));
    }
};

QTEST_MAIN(TestFtpReplyParser)
#include "test_ftpreplyparser.moc"
