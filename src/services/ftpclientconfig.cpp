#include "ftpclientconfig.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSettings>

#include "utils/logging.h"

namespace {

const QString KeyCommandTimeout = QStringLiteral("commandTimeoutMs");
const QString KeyConnectTimeout = QStringLiteral("connectTimeoutMs");
const QString KeyCompletionGrace = QStringLiteral("completionGraceMs");
const QString KeyKeepAlive = QStringLiteral("keepAlive");
const QString KeyUsePassiveHost = QStringLiteral("usePassiveHost");
const QString KeyChunkSize = QStringLiteral("transferChunkSize");
const QString KeyDebug = QStringLiteral("debug");

QString settingsKey(const QString &key)
{
    return QStringLiteral("ftp/") + key;
}

} // namespace

void FtpClientConfig::sanitize()
{
    if (commandTimeoutMs <= 0) {
        qWarning() << "FtpClientConfig: invalid commandTimeoutMs" << commandTimeoutMs << "- using default";
        commandTimeoutMs = DefaultCommandTimeoutMs;
    }
    if (connectTimeoutMs <= 0) {
        qWarning() << "FtpClientConfig: invalid connectTimeoutMs" << connectTimeoutMs << "- using default";
        connectTimeoutMs = DefaultConnectTimeoutMs;
    }
    if (completionGraceMs < 0) {
        completionGraceMs = DefaultCompletionGraceMs;
    }
    if (completionGraceMs >= commandTimeoutMs) {
        qWarning() << "FtpClientConfig: completionGraceMs must be shorter than commandTimeoutMs,"
                   << "clamping" << completionGraceMs << "to" << commandTimeoutMs / 2;
        completionGraceMs = commandTimeoutMs / 2;
    }
    if (transferChunkSize <= 0) {
        transferChunkSize = DefaultTransferChunkSize;
    }
}

FtpClientConfig FtpClientConfig::fromSettings(const QSettings &settings)
{
    FtpClientConfig config;
    config.commandTimeoutMs = settings.value(settingsKey(KeyCommandTimeout), config.commandTimeoutMs).toInt();
    config.connectTimeoutMs = settings.value(settingsKey(KeyConnectTimeout), config.connectTimeoutMs).toInt();
    config.completionGraceMs = settings.value(settingsKey(KeyCompletionGrace), config.completionGraceMs).toInt();
    config.keepAlive = settings.value(settingsKey(KeyKeepAlive), config.keepAlive).toBool();
    config.usePassiveHost = settings.value(settingsKey(KeyUsePassiveHost), config.usePassiveHost).toBool();
    config.transferChunkSize = settings.value(settingsKey(KeyChunkSize), config.transferChunkSize).toInt();
    config.debug = settings.value(settingsKey(KeyDebug), config.debug).toBool();
    config.sanitize();
    return config;
}

FtpClientConfig FtpClientConfig::fromJson(const QJsonObject &json)
{
    FtpClientConfig config;
    config.commandTimeoutMs = json.value(KeyCommandTimeout).toInt(config.commandTimeoutMs);
    config.connectTimeoutMs = json.value(KeyConnectTimeout).toInt(config.connectTimeoutMs);
    config.completionGraceMs = json.value(KeyCompletionGrace).toInt(config.completionGraceMs);
    config.keepAlive = json.value(KeyKeepAlive).toBool(config.keepAlive);
    config.usePassiveHost = json.value(KeyUsePassiveHost).toBool(config.usePassiveHost);
    config.transferChunkSize = json.value(KeyChunkSize).toInt(config.transferChunkSize);
    config.debug = json.value(KeyDebug).toBool(config.debug);
    config.sanitize();
    return config;
}

QJsonObject FtpClientConfig::parseConfigFile(const QByteArray &data, QString *errorMessage)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) {
            *errorMessage = QString("JSON parse error at offset %1: %2")
                                .arg(parseError.offset)
                                .arg(parseError.errorString());
        }
        return QJsonObject();
    }

    if (!doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Configuration root must be a JSON object");
        }
        return QJsonObject();
    }

    return doc.object();
}

void FtpClientConfig::saveToSettings(QSettings &settings) const
{
    settings.setValue(settingsKey(KeyCommandTimeout), commandTimeoutMs);
    settings.setValue(settingsKey(KeyConnectTimeout), connectTimeoutMs);
    settings.setValue(settingsKey(KeyCompletionGrace), completionGraceMs);
    settings.setValue(settingsKey(KeyKeepAlive), keepAlive);
    settings.setValue(settingsKey(KeyUsePassiveHost), usePassiveHost);
    settings.setValue(settingsKey(KeyChunkSize), transferChunkSize);
    settings.setValue(settingsKey(KeyDebug), debug);
}

void FtpClientConfig::log(const QString &message) const
{
    if (debug && logger) {
        logger(QStringLiteral("[FTP Debug] ") + message);
    } else if (debug) {
        qDebug().noquote() << "FTP:" << message;
    } else {
        LOG_VERBOSE().noquote() << "FTP:" << message;
    }
}
