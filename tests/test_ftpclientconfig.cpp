/**
 * @file test_ftpclientconfig.cpp
 * @brief Unit tests for FtpClientConfig loading and validation.
 *
 * Tests verify:
 * - Defaults form a working configuration
 * - Out-of-range values are replaced
 * - JSON and QSettings sources override only the keys they contain
 * - Debug output is routed to the configured sink
 */

#include <QtTest>
#include <QSettings>
#include <QTemporaryDir>

#include "services/ftpclientconfig.h"

class TestFtpClientConfig : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        tempDir_ = new QTemporaryDir();
        QVERIFY(tempDir_->isValid());
    }

    void cleanup()
    {
        delete tempDir_;
        tempDir_ = nullptr;
    }

    void defaults()
    {
        FtpClientConfig config;
        QCOMPARE(config.commandTimeoutMs, 30000);
        QCOMPARE(config.connectTimeoutMs, 10000);
        QCOMPARE(config.completionGraceMs, 5000);
        QCOMPARE(config.transferChunkSize, 64 * 1024);
        QVERIFY(config.keepAlive);
        QVERIFY(config.usePassiveHost);
        QVERIFY(!config.debug);

        FtpClientConfig sanitized = config;
        sanitized.sanitize();
        QCOMPARE(sanitized.commandTimeoutMs, config.commandTimeoutMs);
        QCOMPARE(sanitized.completionGraceMs, config.completionGraceMs);
    }

    void sanitize_replacesInvalidValues()
    {
        FtpClientConfig config;
        config.commandTimeoutMs = -1;
        config.connectTimeoutMs = 0;
        config.completionGraceMs = -5;
        config.transferChunkSize = 0;

        config.sanitize();

        QCOMPARE(config.commandTimeoutMs, FtpClientConfig::DefaultCommandTimeoutMs);
        QCOMPARE(config.connectTimeoutMs, FtpClientConfig::DefaultConnectTimeoutMs);
        QCOMPARE(config.completionGraceMs, FtpClientConfig::DefaultCompletionGraceMs);
        QCOMPARE(config.transferChunkSize, FtpClientConfig::DefaultTransferChunkSize);
    }

    void sanitize_graceStaysBelowCommandTimeout()
    {
        FtpClientConfig config;
        config.commandTimeoutMs = 4000;
        config.completionGraceMs = 10000;

        config.sanitize();

        QCOMPARE(config.completionGraceMs, 2000);
    }

    void sanitize_zeroGraceIsKept()
    {
        FtpClientConfig config;
        config.completionGraceMs = 0;
        config.sanitize();
        QCOMPARE(config.completionGraceMs, 0);
    }

    void fromJson_overridesGivenKeys()
    {
        QJsonObject json;
        json["commandTimeoutMs"] = 15000;
        json["completionGraceMs"] = 1000;
        json["usePassiveHost"] = false;
        json["debug"] = true;

        const FtpClientConfig config = FtpClientConfig::fromJson(json);

        QCOMPARE(config.commandTimeoutMs, 15000);
        QCOMPARE(config.completionGraceMs, 1000);
        QVERIFY(!config.usePassiveHost);
        QVERIFY(config.debug);
        QCOMPARE(config.connectTimeoutMs, FtpClientConfig::DefaultConnectTimeoutMs);
        QVERIFY(config.keepAlive);
    }

    void parseConfigFile_valid()
    {
        QString error;
        const QJsonObject json = FtpClientConfig::parseConfigFile(
            R"({"connectTimeoutMs": 2500, "transferChunkSize": 8192})", &error);

        QVERIFY(error.isEmpty());
        const FtpClientConfig config = FtpClientConfig::fromJson(json);
        QCOMPARE(config.connectTimeoutMs, 2500);
        QCOMPARE(config.transferChunkSize, 8192);
    }

    void parseConfigFile_syntaxError()
    {
        QString error;
        const QJsonObject json = FtpClientConfig::parseConfigFile("{\"commandTimeoutMs\": ", &error);

        QVERIFY(json.isEmpty());
        QVERIFY(error.startsWith("JSON parse error"));
    }

    void parseConfigFile_rootNotObject()
    {
        QString error;
        const QJsonObject json = FtpClientConfig::parseConfigFile("[1, 2, 3]", &error);

        QVERIFY(json.isEmpty());
        QCOMPARE(error, QString("Configuration root must be a JSON object"));
    }

    void settings_roundTrip()
    {
        const QString path = tempDir_->filePath("ftpcore.ini");

        FtpClientConfig original;
        original.commandTimeoutMs = 12000;
        original.completionGraceMs = 0;
        original.keepAlive = false;

        {
            QSettings settings(path, QSettings::IniFormat);
            original.saveToSettings(settings);
        }

        QSettings settings(path, QSettings::IniFormat);
        QCOMPARE(settings.value("ftp/commandTimeoutMs").toInt(), 12000);

        const FtpClientConfig loaded = FtpClientConfig::fromSettings(settings);
        QCOMPARE(loaded.commandTimeoutMs, 12000);
        QCOMPARE(loaded.completionGraceMs, 0);
        QVERIFY(!loaded.keepAlive);
        QCOMPARE(loaded.connectTimeoutMs, FtpClientConfig::DefaultConnectTimeoutMs);
    }

    void settings_missingKeysKeepDefaults()
    {
        QSettings settings(tempDir_->filePath("empty.ini"), QSettings::IniFormat);
        const FtpClientConfig config = FtpClientConfig::fromSettings(settings);

        QCOMPARE(config.commandTimeoutMs, FtpClientConfig::DefaultCommandTimeoutMs);
        QCOMPARE(config.completionGraceMs, FtpClientConfig::DefaultCompletionGraceMs);
    }

    void log_goesToLoggerWhenDebugging()
    {
        QStringList lines;
        FtpClientConfig config;
        config.logger = [&lines](const QString &line) { lines.append(line); };

        config.log("hidden");
        QVERIFY(lines.isEmpty());

        config.debug = true;
        config.log("Connecting to host");
        QCOMPARE(lines, QStringList{"[FTP Debug] Connecting to host"});
    }

private:
    QTemporaryDir *tempDir_ = nullptr;
};

QTEST_MAIN(TestFtpClientConfig)
#include "test_ftpclientconfig.moc"
