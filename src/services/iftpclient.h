/**
 * @file iftpclient.h
 * @brief Interface for FTP client implementations.
 *
 * This interface allows dependency injection of FTP clients, so that code
 * built on top of a session (such as FtpDirectoryOperator) can be tested
 * against a scripted mock.
 */

#ifndef IFTPCLIENT_H
#define IFTPCLIENT_H

#include <QByteArray>
#include <QDateTime>
#include <QObject>
#include <QString>

#include <functional>
#include <optional>

#include "ftpentry.h"
#include "ftpreply.h"

/// @name Completion Callbacks
/// Each is called exactly once per request, with either an error or a value.
/// @{
using PathHandler = std::function<void(const std::optional<FtpError> &error, const QString &path)>;
using SizeHandler = std::function<void(const std::optional<FtpError> &error, qint64 size)>;
using TimeHandler = std::function<void(const std::optional<FtpError> &error, const QDateTime &time)>;
using TextHandler = std::function<void(const std::optional<FtpError> &error, const QString &text)>;
using DataHandler = std::function<void(const std::optional<FtpError> &error, const QByteArray &data)>;
using ListingHandler = std::function<void(const std::optional<FtpError> &error, const RemoteListing &entries)>;
/// @}

/**
 * @brief Abstract interface for FTP client implementations.
 *
 * Every request takes a completion callback. Requests must be issued one at
 * a time: the next request may be started from the previous one's callback.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IFtpClient *ftp = new FtpSession(this);
 *
 * // Test code
 * IFtpClient *ftp = new MockFtpClient(this);
 *
 * // Both can be used identically
 * ftp->setHost("ftp.example.com");
 * ftp->connectToHost([ftp](const std::optional<FtpError> &error) {
 *     if (!error) {
 *         ftp->changeDirectory("/pub", {});
 *     }
 * });
 * @endcode
 */
class IFtpClient : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Connection state of the FTP client.
     */
    enum class State {
        Disconnected,  ///< Not connected to any host
        Connecting,    ///< TCP connection in progress
        Connected,     ///< TCP connected, awaiting server greeting
        LoggingIn,     ///< Authentication in progress
        Ready,         ///< Logged in and ready for commands
        Busy           ///< Data transfer in progress
    };
    Q_ENUM(State)

    /**
     * @brief Constructs an FTP client interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit IFtpClient(QObject *parent = nullptr) : QObject(parent) {}

    /**
     * @brief Virtual destructor.
     */
    ~IFtpClient() override = default;

    /// @name Configuration
    /// @{

    /**
     * @brief Sets the target host and port.
     * @param host Hostname or IP address of the FTP server.
     * @param port FTP control port (default: 21).
     */
    virtual void setHost(const QString &host, quint16 port = 21) = 0;

    /**
     * @brief Returns the currently configured host.
     * @return The hostname or IP address.
     */
    [[nodiscard]] virtual QString host() const = 0;

    /**
     * @brief Sets login credentials.
     * @param user Username for FTP login.
     * @param password Password for FTP login.
     */
    virtual void setCredentials(const QString &user, const QString &password) = 0;
    /// @}

    /// @name Connection State
    /// @{

    /**
     * @brief Returns the current connection state.
     * @return The current State enum value.
     */
    [[nodiscard]] virtual State state() const = 0;

    /**
     * @brief Checks if the client is connected and ready.
     * @return True if in Ready or Busy state.
     */
    [[nodiscard]] virtual bool isConnected() const = 0;

    /**
     * @brief Checks if successfully logged in.
     * @return True if authentication completed successfully.
     */
    [[nodiscard]] virtual bool isLoggedIn() const = 0;

    /**
     * @brief Returns the last directory entered with changeDirectory().
     * @return The current directory path.
     */
    [[nodiscard]] virtual QString currentDirectory() const = 0;
    /// @}

    /// @name Connection Management
    /// @{

    /**
     * @brief Connects, waits for the greeting and logs in.
     * @param handler Called once login succeeded or failed.
     */
    virtual void connectToHost(DoneHandler handler) = 0;

    /**
     * @brief Sends QUIT and closes the connection.
     */
    virtual void disconnect() = 0;
    /// @}

    /// @name Directory Operations
    /// @{
    virtual void changeDirectory(const QString &path, DoneHandler handler) = 0;
    virtual void printWorkingDirectory(PathHandler handler) = 0;
    virtual void makeDirectory(const QString &path, DoneHandler handler) = 0;

    /**
     * @brief Removes an empty directory.
     * @param path Path of directory to remove.
     * @param handler Completion callback.
     */
    virtual void removeDirectory(const QString &path, DoneHandler handler) = 0;

    /**
     * @brief Lists a directory as raw server text.
     * @param path Directory to list; empty lists the current directory.
     * @param handler Receives the listing text.
     */
    virtual void list(const QString &path, TextHandler handler) = 0;

    /**
     * @brief Lists a directory and parses the entries.
     * @param path Directory to list; empty lists the current directory.
     * @param handler Receives the entries without "." and "..".
     */
    virtual void listDetailed(const QString &path, ListingHandler handler) = 0;
    /// @}

    /// @name File Operations
    /// @{

    /**
     * @brief Uploads an in-memory payload.
     * @param data File contents.
     * @param remotePath Destination path on the server.
     * @param handler Completion callback.
     */
    virtual void upload(const QByteArray &data, const QString &remotePath, DoneHandler handler) = 0;

    /**
     * @brief Downloads a file into memory.
     * @param remotePath Path of the remote file.
     * @param handler Receives the file contents.
     */
    virtual void download(const QString &remotePath, DataHandler handler) = 0;

    /**
     * @brief Deletes a file from the remote server.
     * @param path Path of the file to delete.
     * @param handler Completion callback.
     */
    virtual void remove(const QString &path, DoneHandler handler) = 0;

    /**
     * @brief Renames or moves a file on the remote server.
     * @param oldPath Current path of the file.
     * @param newPath New path for the file.
     * @param handler Completion callback.
     */
    virtual void rename(const QString &oldPath, const QString &newPath, DoneHandler handler) = 0;

    virtual void size(const QString &path, SizeHandler handler) = 0;
    virtual void modifiedTime(const QString &path, TimeHandler handler) = 0;
    /// @}

    /**
     * @brief Aborts the current transfer, if any.
     */
    virtual void abort() = 0;

signals:
    /// @name Connection Signals
    /// @{

    /**
     * @brief Emitted when the connection state changes.
     * @param state The new connection state.
     */
    void stateChanged(IFtpClient::State state);

    /**
     * @brief Emitted when successfully connected and logged in.
     */
    void connected();

    /**
     * @brief Emitted when disconnected from the server.
     */
    void disconnected();

    /**
     * @brief Emitted when an operation fails.
     * @param message Human-readable error description.
     */
    void error(const QString &message);
    /// @}

    /// @name Transfer Signals
    /// @{

    /**
     * @brief Emitted during file download to report progress.
     * @param file The remote file path.
     * @param received Bytes received so far.
     * @param total Total file size (0 if unknown).
     */
    void downloadProgress(const QString &file, qint64 received, qint64 total);

    /**
     * @brief Emitted during file upload to report progress.
     * @param file The remote file path.
     * @param sent Bytes sent so far.
     * @param total Total file size (0 if unknown).
     */
    void uploadProgress(const QString &file, qint64 sent, qint64 total);
    /// @}
};

#endif // IFTPCLIENT_H
