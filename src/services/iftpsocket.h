/**
 * @file iftpsocket.h
 * @brief Interface for the byte-stream sockets used by the FTP engine.
 *
 * This interface allows dependency injection of the control and data
 * connections, enabling runtime swapping between QTcpSocket and scripted
 * mock transports for testing.
 */

#ifndef IFTPSOCKET_H
#define IFTPSOCKET_H

#include <QByteArray>
#include <QObject>
#include <QString>

#include <functional>

/**
 * @brief Abstract byte-stream connection.
 *
 * The engine only ever needs open, write, read events, close and error
 * events from a connection; this is that contract. Implementations emit
 * errorOccurred() with @c remoteClosed set when the peer closed the stream
 * normally, which the data channel treats as end-of-data rather than failure.
 */
class IFtpSocket : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a socket interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit IFtpSocket(QObject *parent = nullptr) : QObject(parent) {}

    ~IFtpSocket() override = default;

    /**
     * @brief Starts connecting; emits connected() or errorOccurred().
     */
    virtual void connectToHost(const QString &host, quint16 port) = 0;

    /**
     * @brief Queues bytes for sending.
     * @return Number of bytes accepted, or -1 on failure.
     */
    virtual qint64 write(const QByteArray &data) = 0;

    [[nodiscard]] virtual QByteArray readAll() = 0;
    [[nodiscard]] virtual qint64 bytesAvailable() const = 0;
    [[nodiscard]] virtual qint64 bytesToWrite() const = 0;

    /**
     * @brief Closes after pending writes are flushed; emits disconnected().
     */
    virtual void disconnectFromHost() = 0;

    /**
     * @brief Closes immediately, discarding pending data.
     */
    virtual void abort() = 0;

    [[nodiscard]] virtual bool isConnected() const = 0;
    [[nodiscard]] virtual QString peerAddress() const = 0;
    [[nodiscard]] virtual QString errorString() const = 0;

    /// @name Socket Options
    /// @{
    virtual void setLowDelay(bool enabled) = 0;
    virtual void setKeepAlive(bool enabled) = 0;
    /// @}

signals:
    void connected();
    void readyRead();
    void bytesWritten(qint64 bytes);
    void disconnected();

    /**
     * @brief Emitted on connection failure or I/O error.
     * @param message Human-readable error description.
     * @param remoteClosed True if the peer simply closed the connection.
     */
    void errorOccurred(const QString &message, bool remoteClosed);
};

/// Creates a new unconnected socket owned by @p parent.
using FtpSocketFactory = std::function<IFtpSocket *(QObject *parent)>;

#endif // IFTPSOCKET_H
