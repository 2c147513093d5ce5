/**
 * @file ftpclientconfig.h
 * @brief Fixed configuration for an FTP session.
 */

#ifndef FTPCLIENTCONFIG_H
#define FTPCLIENTCONFIG_H

#include <QJsonObject>
#include <QString>

#include <functional>

class QSettings;

/**
 * @brief Timeouts, socket options and logging for one FtpSession.
 *
 * Every field has a documented default; a default-constructed config is a
 * working configuration. Values can be loaded from QSettings ("ftp/..."
 * keys) or from a JSON object using the same key names.
 *
 * @par The completion grace period
 * After a transfer's data connection closes, the session waits at most
 * completionGraceMs for the server's "226 Transfer complete". If it does not
 * arrive in time the transfer is reported successful but unconfirmed.
 * Set it to 0 to always wait for the reply (up to commandTimeoutMs).
 */
struct FtpClientConfig {
    /// @name Defaults
    /// @{
    static constexpr int DefaultCommandTimeoutMs = 30000;  ///< Reply deadline per command
    static constexpr int DefaultConnectTimeoutMs = 10000;  ///< Greeting + login deadline
    static constexpr int DefaultCompletionGraceMs = 5000;  ///< Wait for 226 after data close
    static constexpr int DefaultTransferChunkSize = 64 * 1024;  ///< Upload write size
    /// @}

    int commandTimeoutMs = DefaultCommandTimeoutMs;
    int connectTimeoutMs = DefaultConnectTimeoutMs;
    int completionGraceMs = DefaultCompletionGraceMs;
    bool keepAlive = true;          ///< SO_KEEPALIVE on the control connection
    bool usePassiveHost = true;     ///< False: connect data channel to control peer instead
    int transferChunkSize = DefaultTransferChunkSize;
    bool debug = false;             ///< Emit protocol traffic to the logger
    std::function<void(const QString &)> logger;  ///< Debug sink; qDebug() when empty

    /**
     * @brief Replaces out-of-range values with defaults.
     *
     * Negative timeouts fall back to defaults and the grace period is kept
     * below the command timeout.
     */
    void sanitize();

    /**
     * @brief Loads values from QSettings, keeping defaults for missing keys.
     */
    [[nodiscard]] static FtpClientConfig fromSettings(const QSettings &settings);

    /**
     * @brief Loads values from a JSON object, keeping defaults for missing keys.
     */
    [[nodiscard]] static FtpClientConfig fromJson(const QJsonObject &json);

    /**
     * @brief Parses a JSON configuration file's contents.
     * @param data File contents.
     * @param errorMessage Receives the parse error, if any.
     * @return The top-level object, empty on error.
     */
    [[nodiscard]] static QJsonObject parseConfigFile(const QByteArray &data,
                                                     QString *errorMessage = nullptr);

    void saveToSettings(QSettings &settings) const;

    /**
     * @brief Writes a protocol debug line.
     *
     * Goes to the logger sink when debug is on and a sink is set, to qDebug()
     * when debug is on without a sink, and to LOG_VERBOSE() otherwise.
     */
    void log(const QString &message) const;
};

#endif // FTPCLIENTCONFIG_H
