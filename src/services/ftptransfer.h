/**
 * @file ftptransfer.h
 * @brief One data transfer (STOR, RETR or LIST) over a passive data connection.
 */

#ifndef FTPTRANSFER_H
#define FTPTRANSFER_H

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>

#include <functional>
#include <optional>

#include "ftpcontrolchannel.h"
#include "ftppassivenegotiator.h"
#include "ftpreply.h"

class IFtpSocket;
class QIODevice;

/**
 * @brief Outcome of a transfer.
 */
struct FtpTransferResult {
    std::optional<FtpError> error;  ///< Set when the transfer failed
    qint64 bytesTransferred = 0;    ///< Payload bytes moved over the data connection
    QByteArray data;                ///< Received payload when no sink was given
    bool confirmed = false;         ///< True once the server's completion reply was seen
    FtpReply reply;                 ///< Completion reply when confirmed

    [[nodiscard]] bool ok() const { return !error.has_value(); }
};

Q_DECLARE_METATYPE(FtpTransferResult)

/// Completion callback of a transfer. Called exactly once.
using TransferHandler = std::function<void(const FtpTransferResult &result)>;

/**
 * @brief Drives a single transfer to exactly one resolution.
 *
 * A transfer finishes only when two independent events have both happened:
 * the data connection has closed and the control connection has delivered the
 * command's completion reply. They may arrive in either order. A failing
 * completion reply fails the transfer whenever it arrives, even if all data
 * was already received.
 *
 * If the data connection closes and the completion reply does not follow
 * within FtpClientConfig::completionGraceMs, the transfer is reported as
 * successful but unconfirmed and the outstanding command is abandoned on the
 * control channel, which drains its late reply. With a grace period of 0 the
 * transfer waits for the reply up to the command timeout.
 *
 * The object is single-use: start() once, then wait for finished().
 *
 * @par Example usage:
 * @code
 * auto *transfer = new FtpTransfer(channel, &negotiator,
 *                                  FtpTransfer::Kind::Retrieve, "/readme.txt", this);
 * connect(transfer, &FtpTransfer::finished, this,
 *         [transfer](const FtpTransferResult &result) {
 *             if (result.ok()) {
 *                 qDebug() << "Got" << result.data.size() << "bytes";
 *             }
 *             transfer->deleteLater();
 *         });
 * transfer->start();
 * @endcode
 */
class FtpTransfer : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief The data command issued on the control channel.
     */
    enum class Kind {
        Store,     ///< STOR: bytes flow to the server
        Retrieve,  ///< RETR: bytes flow from the server
        List       ///< LIST: directory listing from the server
    };
    Q_ENUM(Kind)

    /**
     * @brief Progress through the transfer life cycle.
     */
    enum class State {
        Idle,                  ///< Not started
        PassiveNegotiated,     ///< PASV answered, data connection being opened
        DataChannelOpen,       ///< Data connection established
        CommandIssued,         ///< STOR/RETR/LIST written
        DataInFlight,          ///< Payload bytes are moving
        DataChannelClosed,     ///< Data connection closed, waiting for the reply
        ControlReplyReceived,  ///< Completion reply seen
        SecondaryTimeout,      ///< Grace period elapsed without a reply
        Resolved,              ///< Finished successfully
        Failed                 ///< Finished with an error
    };
    Q_ENUM(State)

    /**
     * @brief Constructs a transfer.
     * @param channel Control channel (not owned).
     * @param negotiator Passive negotiator bound to the same channel (not owned).
     * @param kind Data command to issue.
     * @param remotePath Command argument; may be empty for LIST.
     * @param parent Optional parent QObject for memory management.
     */
    FtpTransfer(FtpControlChannel *channel, FtpPassiveNegotiator *negotiator,
                Kind kind, const QString &remotePath, QObject *parent = nullptr);

    ~FtpTransfer() override;

    /**
     * @brief Sets the upload source (Store only). Not owned; must be open.
     */
    void setSource(QIODevice *source);

    /**
     * @brief Sets the device received bytes are written to.
     *
     * Without a sink the payload is collected into FtpTransferResult::data.
     * Not owned; must be open for writing.
     */
    void setSink(QIODevice *sink);

    /**
     * @brief Sets the expected payload size reported through progress().
     */
    void setExpectedSize(qint64 size) { expectedSize_ = size; }

    /**
     * @brief Negotiates passive mode and runs the transfer.
     */
    void start();

    /**
     * @brief Fails the transfer immediately, closing the data connection.
     */
    void abort(const QString &reason);

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] QString remotePath() const { return remotePath_; }
    [[nodiscard]] qint64 bytesTransferred() const { return bytes_; }
    [[nodiscard]] bool isFinished() const { return finished_; }

    /**
     * @brief Builds the control command for a transfer, e.g. "RETR /a.txt".
     */
    [[nodiscard]] static QString commandFor(Kind kind, const QString &remotePath);

    /**
     * @brief Extracts the size from "150 Opening BINARY mode data connection (1234 bytes)".
     * @return The size, or -1 if the reply carries none.
     */
    [[nodiscard]] static qint64 parseAnnouncedSize(const QString &message);

signals:
    void stateChanged(FtpTransfer::State state);

    /**
     * @brief Emitted as payload bytes move.
     * @param bytes Bytes transferred so far.
     * @param total Expected total, or 0 if unknown.
     */
    void progress(qint64 bytes, qint64 total);

    /**
     * @brief Emitted exactly once when the transfer resolves.
     */
    void finished(const FtpTransferResult &result);

private slots:
    void onDataConnected();
    void onDataReadyRead();
    void onDataBytesWritten(qint64 bytes);
    void onDataDisconnected();
    void onDataError(const QString &message, bool remoteClosed);
    void onPreliminaryReply(const FtpReply &reply);
    void onGraceExpired();
    void onIdleExpired();

private:
    void onPassiveNegotiated(const std::optional<FtpError> &error, const FtpPassiveEndpoint &endpoint);
    void onControlReply(const std::optional<FtpError> &error, const FtpReply &reply);
    void issueCommand();
    void writeNextChunk();
    void readAvailable();
    void evaluateJoin();
    void succeed(bool confirmed);
    void fail(const FtpError &error);
    void finish(FtpTransferResult result);
    void setState(State state);
    void releaseDataSocket(bool abortConnection);
    void abandonCommand(const QString &reason);

    QPointer<FtpControlChannel> channel_;
    FtpPassiveNegotiator *negotiator_ = nullptr;
    Kind kind_;
    QString remotePath_;

    QIODevice *source_ = nullptr;
    QIODevice *sink_ = nullptr;
    IFtpSocket *dataSocket_ = nullptr;
    QTimer *graceTimer_ = nullptr;
    QTimer *idleTimer_ = nullptr;

    State state_ = State::Idle;
    bool started_ = false;
    bool finished_ = false;

    // Join bookkeeping
    bool commandIssued_ = false;
    bool controlReplied_ = false;
    bool commandAbandoned_ = false;
    bool dataClosed_ = false;
    bool uploadComplete_ = false;
    bool prematureClose_ = false;
    FtpReply controlReply_;

    QByteArray buffer_;
    qint64 bytes_ = 0;
    qint64 expectedSize_ = 0;
};

#endif // FTPTRANSFER_H
