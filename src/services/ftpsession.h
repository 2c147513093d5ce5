/**
 * @file ftpsession.h
 * @brief FTP session: login, command wrappers and transfers over one control connection.
 *
 * Provides asynchronous FTP operations for file transfers, directory
 * management and remote file system inspection. All results are delivered
 * through completion callbacks; failures are additionally reported through
 * the error() signal.
 */

#ifndef FTPSESSION_H
#define FTPSESSION_H

#include <QObject>
#include <QPointer>
#include <QTimer>

#include <functional>
#include <memory>
#include <optional>

#include "ftpclientconfig.h"
#include "ftppassivenegotiator.h"
#include "ftptransfer.h"
#include "iftpclient.h"
#include "iftpsocket.h"

class FtpControlChannel;
class QIODevice;

/**
 * @brief What stat() could find out about a remote path.
 *
 * Fields that could not be determined are empty, e.g. a path only found in
 * its parent's listing has neither size nor type.
 */
struct FtpStatInfo {
    bool exists = false;
    std::optional<qint64> size;
    std::optional<bool> isFile;
    std::optional<bool> isDirectory;
};

/**
 * @brief Session counters, passwords masked.
 */
struct FtpSessionStats {
    bool connected = false;
    bool authenticated = false;
    int commandCount = 0;
    QString lastCommand;
    int transfersCompleted = 0;
    qint64 bytesUploaded = 0;
    qint64 bytesDownloaded = 0;
};

using StatHandler = std::function<void(const std::optional<FtpError> &error, const FtpStatInfo &info)>;
using BoolHandler = std::function<void(const std::optional<FtpError> &error, bool value)>;

/**
 * @brief Asynchronous FTP client session.
 *
 * One session owns one control connection and runs at most one command or
 * transfer at a time. Several sessions can be used side by side; nothing is
 * shared between them.
 *
 * @par Example usage:
 * @code
 * FtpSession *ftp = new FtpSession(this);
 * ftp->setHost("ftp.example.com");
 * ftp->setCredentials("user", "secret");
 *
 * ftp->connectToHost([ftp](const std::optional<FtpError> &error) {
 *     if (error) {
 *         qWarning() << error->toString();
 *         return;
 *     }
 *     ftp->download("/readme.txt",
 *         [](const std::optional<FtpError> &error, const QByteArray &data) {
 *             if (!error) {
 *                 qDebug() << data;
 *             }
 *         });
 * });
 * @endcode
 */
class FtpSession : public IFtpClient
{
    Q_OBJECT

public:
    static constexpr quint16 DefaultPort = 21;  ///< Default FTP control port
    static constexpr int AbortTimeoutMs = 5000;  ///< Reply deadline for ABOR

    /**
     * @brief Representation type for TYPE.
     */
    enum class TransferType {
        Binary,  ///< TYPE I
        Ascii    ///< TYPE A
    };
    Q_ENUM(TransferType)

    /**
     * @brief Constructs a session with default configuration over TCP.
     * @param parent Optional parent QObject for memory management.
     */
    explicit FtpSession(QObject *parent = nullptr);

    /**
     * @brief Constructs a session.
     * @param config Timeouts, socket options and logging.
     * @param socketFactory Creates control and data sockets.
     * @param parent Optional parent QObject for memory management.
     */
    FtpSession(const FtpClientConfig &config, FtpSocketFactory socketFactory,
               QObject *parent = nullptr);

    /**
     * @brief Destructor. Drops the connection without sending QUIT.
     */
    ~FtpSession() override;

    [[nodiscard]] const FtpClientConfig &config() const { return config_; }

    /// @name IFtpClient
    /// @{
    void setHost(const QString &host, quint16 port = DefaultPort) override;
    [[nodiscard]] QString host() const override { return host_; }
    [[nodiscard]] quint16 port() const { return port_; }
    void setCredentials(const QString &user, const QString &password) override;

    [[nodiscard]] State state() const override { return state_; }
    [[nodiscard]] bool isConnected() const override { return state_ == State::Ready || state_ == State::Busy; }
    [[nodiscard]] bool isLoggedIn() const override;
    [[nodiscard]] QString currentDirectory() const override { return currentDirectory_; }

    void connectToHost(DoneHandler handler) override;
    void disconnect() override;

    void changeDirectory(const QString &path, DoneHandler handler) override;
    void printWorkingDirectory(PathHandler handler) override;
    void makeDirectory(const QString &path, DoneHandler handler) override;
    void removeDirectory(const QString &path, DoneHandler handler) override;
    void list(const QString &path, TextHandler handler) override;
    void listDetailed(const QString &path, ListingHandler handler) override;

    void upload(const QByteArray &data, const QString &remotePath, DoneHandler handler) override;
    void download(const QString &remotePath, DataHandler handler) override;
    void remove(const QString &path, DoneHandler handler) override;
    void rename(const QString &oldPath, const QString &newPath, DoneHandler handler) override;
    void size(const QString &path, SizeHandler handler) override;
    void modifiedTime(const QString &path, TimeHandler handler) override;

    /**
     * @brief Aborts the running transfer and sends ABOR.
     */
    void abort() override;
    /// @}

    /// @name Engine Access
    /// @{

    /**
     * @brief Sends a raw command and returns its terminal reply.
     * @param command Command line without CRLF.
     * @param tolerantOfPreliminary Wait past 1xx replies.
     * @param handler Receives the reply or the failure.
     */
    void sendCommand(const QString &command, bool tolerantOfPreliminary, ReplyHandler handler);

    /**
     * @brief Sends PASV and decodes the endpoint without opening it.
     */
    void negotiatePassive(PassiveHandler handler);

    /**
     * @brief Runs one transfer.
     * @param kind STOR, RETR or LIST.
     * @param remotePath Command argument.
     * @param source Upload source for Store (not owned).
     * @param sink Download sink; nullptr collects into the result (not owned).
     * @param handler Receives the transfer result.
     */
    void runTransfer(FtpTransfer::Kind kind, const QString &remotePath,
                     QIODevice *source, QIODevice *sink, TransferHandler handler);
    /// @}

    /// @name Additional Commands
    /// @{
    void chmod(const QString &mode, const QString &path, DoneHandler handler);
    void site(const QString &arguments, ReplyHandler handler);
    void setTransferType(TransferType type, DoneHandler handler);
    /// @}

    /// @name Additional Transfers
    /// @{

    /**
     * @brief Uploads from an open device (not owned).
     */
    void upload(QIODevice *source, const QString &remotePath, DoneHandler handler);

    /**
     * @brief Uploads a local file.
     * @param localPath File to read.
     * @param remotePath Destination path on the server.
     * @param ensureDir Create the remote parent directories first.
     * @param handler Completion callback.
     */
    void uploadFile(const QString &localPath, const QString &remotePath, bool ensureDir,
                    DoneHandler handler);

    /**
     * @brief Streams a download into @p sink (not owned) as bytes arrive.
     * @param handler Receives the number of bytes written.
     */
    void downloadStream(const QString &remotePath, QIODevice *sink, SizeHandler handler);

    /**
     * @brief Downloads into a local file. A failed download leaves no file behind.
     */
    void downloadFile(const QString &remotePath, const QString &localPath, DoneHandler handler);
    /// @}

    /// @name Inspection
    /// @{

    /**
     * @brief Determines whether @p path exists and what it is.
     *
     * Tries SIZE (file), then CWD into the path and back (directory), then
     * looks for the name in the parent's listing. Only NotConnected and
     * busy-session failures are reported as errors; everything else yields
     * exists == false.
     */
    void stat(const QString &path, StatHandler handler);

    void exists(const QString &path, BoolHandler handler);

    [[nodiscard]] FtpSessionStats stats() const;
    /// @}

    /**
     * @brief Sends QUIT, closes the connection and reports completion.
     *
     * A failing QUIT is logged and ignored.
     */
    void close(DoneHandler handler);

    /**
     * @brief Parses a PWD reply: 257 "/path" is current directory.
     * @return The quoted path with doubled quotes collapsed, or "/" if none.
     */
    [[nodiscard]] static QString parsePwdReply(const QString &message);

signals:
    /// @name Diagnostic Event Stream
    /// @{
    void commandSent(const QString &maskedCommand);
    void replyLineReceived(const QString &line);
    /// @}

private slots:
    void onControlConnected();
    void onConnectTimeout();
    void onConnectionLost(const QString &reason);
    void onServerClosing(const QString &message);

private:
    void setState(State state);
    void login();
    void sendPassword();
    void finishConnect(const std::optional<FtpError> &error);
    void teardown();

    [[nodiscard]] std::optional<FtpError> checkReady(const QString &path) const;
    void runCommand(const QString &command, const QString &path, ReplyHandler handler);
    void runSimpleCommand(const QString &command, const QString &path, DoneHandler handler);
    void reportError(const FtpError &error);
    void statAsDirectory(const QString &path, StatHandler handler);
    void statFromParentListing(const QString &path, StatHandler handler);

    FtpClientConfig config_;
    FtpSocketFactory socketFactory_;

    QString host_;
    quint16 port_ = DefaultPort;
    QString user_ = QStringLiteral("anonymous");
    QString password_ = QStringLiteral("anonymous@");

    IFtpSocket *controlSocket_ = nullptr;
    FtpControlChannel *channel_ = nullptr;
    std::unique_ptr<FtpPassiveNegotiator> negotiator_;
    QPointer<FtpTransfer> activeTransfer_;
    QTimer *connectTimer_ = nullptr;
    DoneHandler connectHandler_;

    State state_ = State::Disconnected;
    QString currentDirectory_ = QStringLiteral("/");

    int transfersCompleted_ = 0;
    qint64 bytesUploaded_ = 0;
    qint64 bytesDownloaded_ = 0;
};

#endif // FTPSESSION_H
