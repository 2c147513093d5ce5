/**
 * @file ftpcontrolchannel.h
 * @brief Command/reply correlation on the FTP control connection.
 */

#ifndef FTPCONTROLCHANNEL_H
#define FTPCONTROLCHANNEL_H

#include <QObject>
#include <QStringList>
#include <QTimer>

#include <optional>

#include "ftpclientconfig.h"
#include "ftpreply.h"
#include "ftpreplyparser.h"

class IFtpSocket;

/**
 * @brief Serializes commands on the control connection and matches replies.
 *
 * FTP replies carry no request identifier, so they can only be matched to
 * commands by order. The channel therefore allows exactly one outstanding
 * command: it lives in a single-slot register from the moment the command is
 * written until its terminal reply arrives, its deadline fires, or its owner
 * abandons it. Each command's handler is called exactly once.
 *
 * Sending while a command is outstanding is a programming error and is
 * reported to the new caller as ProtocolViolation; the outstanding command is
 * not disturbed.
 *
 * @par Example usage:
 * @code
 * channel->sendCommand("CWD /music", false,
 *     [](const std::optional<FtpError> &error, const FtpReply &reply) {
 *         if (error) {
 *             qWarning() << error->toString();
 *             return;
 *         }
 *         qDebug() << "CWD ok:" << reply.code;
 *     });
 * @endcode
 */
class FtpControlChannel : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a channel over an existing socket.
     * @param socket Control connection (not owned, must outlive the channel).
     * @param config Timeouts and logging.
     * @param parent Optional parent QObject for memory management.
     */
    FtpControlChannel(IFtpSocket *socket, const FtpClientConfig &config,
                      QObject *parent = nullptr);

    ~FtpControlChannel() override;

    [[nodiscard]] IFtpSocket *socket() const { return socket_; }
    [[nodiscard]] const FtpClientConfig &config() const { return config_; }
    void setConfig(const FtpClientConfig &config) { config_ = config; }

    /**
     * @brief Writes a command and waits for its terminal reply.
     * @param command Command line without CRLF.
     * @param tolerantOfPreliminary Keep waiting past 1xx replies (transfers).
     * @param handler Called exactly once with the outcome.
     * @param timeoutMs Deadline override; <= 0 uses commandTimeoutMs.
     */
    void sendCommand(const QString &command, bool tolerantOfPreliminary,
                     ReplyHandler handler, int timeoutMs = 0);

    /**
     * @brief Registers a handler for a reply that arrives without a command.
     *
     * Used for the server greeting sent right after the connection opens.
     */
    void expectReply(const QString &description, ReplyHandler handler, int timeoutMs = 0);

    [[nodiscard]] bool hasPendingCommand() const { return pending_.has_value(); }
    [[nodiscard]] QString pendingCommand() const { return pending_ ? pending_->command : QString(); }

    /**
     * @brief Restarts the outstanding command's deadline.
     *
     * Called while a transfer's data keeps flowing so that a long download
     * is not mistaken for a silent server.
     */
    void touchDeadline();

    [[nodiscard]] bool isDraining() const { return draining_; }

    /**
     * @brief Drops the outstanding command without calling its handler.
     *
     * Its reply may still arrive; the channel then drains it (see
     * isLateTransferReply()) instead of handing it to the next command.
     */
    void abandonPending(const QString &reason);

    /**
     * @brief Fails the outstanding command, if any, with @p error.
     */
    void failPending(const FtpError &error);

    /**
     * @brief Clears parser, drain and login state after a disconnect.
     */
    void reset();

    /// @name Session Statistics
    /// @{
    [[nodiscard]] bool isAuthenticated() const { return authenticated_; }
    void setAuthenticated(bool authenticated) { authenticated_ = authenticated; }
    [[nodiscard]] int commandCount() const { return commandCount_; }
    [[nodiscard]] QString lastCommand() const { return lastCommand_; }
    /// @}

    /**
     * @brief Masks credentials for logging: "PASS secret" becomes "PASS ********".
     */
    [[nodiscard]] static QString maskCommand(const QString &command);

    /**
     * @brief Codes that conclude a data transfer (drained after abandonment).
     */
    [[nodiscard]] static bool isLateTransferReply(int code);

signals:
    /**
     * @brief Emitted for every outgoing command, credentials masked.
     */
    void commandSent(const QString &maskedCommand);

    /**
     * @brief Emitted for every incoming line, including continuations.
     */
    void replyLineReceived(const QString &line);

    /**
     * @brief Emitted when a tolerant command receives a 1xx reply.
     */
    void preliminaryReceived(const FtpReply &reply);

    /**
     * @brief Emitted when the server announces it is closing (421).
     */
    void serverClosing(const QString &message);

    /**
     * @brief Emitted when the control connection drops or fails.
     */
    void connectionLost(const QString &reason);

private slots:
    void onReadyRead();
    void onDeadlineExpired();
    void onSocketDisconnected();
    void onSocketError(const QString &message, bool remoteClosed);

private:
    struct PendingCommand {
        QString command;  // already masked
        bool tolerantOfPreliminary = false;
        ReplyHandler handler;
    };

    void registerPending(const QString &maskedCommand, bool tolerant,
                         ReplyHandler handler, int timeoutMs);
    void handleLine(const QString &line);
    void handleTerminalLine(const FtpReplyLine &line);
    void resolvePending(const std::optional<FtpError> &error, const FtpReply &reply);

    IFtpSocket *socket_ = nullptr;
    FtpClientConfig config_;
    FtpReplyParser parser_;
    QTimer *deadlineTimer_ = nullptr;

    std::optional<PendingCommand> pending_;
    QStringList queuedLines_;
    bool processingLines_ = false;
    bool draining_ = false;

    bool authenticated_ = false;
    int commandCount_ = 0;
    QString lastCommand_;
};

#endif // FTPCONTROLCHANNEL_H
