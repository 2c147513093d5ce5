/**
 * @file tcpftpsocket.h
 * @brief QTcpSocket-backed implementation of IFtpSocket.
 */

#ifndef TCPFTPSOCKET_H
#define TCPFTPSOCKET_H

#include <QTcpSocket>

#include "iftpsocket.h"

/**
 * @brief Production socket used for both control and data connections.
 */
class TcpFtpSocket : public IFtpSocket
{
    Q_OBJECT

public:
    explicit TcpFtpSocket(QObject *parent = nullptr);
    ~TcpFtpSocket() override = default;

    void connectToHost(const QString &host, quint16 port) override;
    qint64 write(const QByteArray &data) override;

    [[nodiscard]] QByteArray readAll() override { return socket_->readAll(); }
    [[nodiscard]] qint64 bytesAvailable() const override { return socket_->bytesAvailable(); }
    [[nodiscard]] qint64 bytesToWrite() const override { return socket_->bytesToWrite(); }

    void disconnectFromHost() override;
    void abort() override;

    [[nodiscard]] bool isConnected() const override;
    [[nodiscard]] QString peerAddress() const override;
    [[nodiscard]] QString errorString() const override { return socket_->errorString(); }

    void setLowDelay(bool enabled) override;
    void setKeepAlive(bool enabled) override;

    /**
     * @brief Returns a factory creating TcpFtpSocket instances.
     */
    [[nodiscard]] static FtpSocketFactory factory();

private slots:
    void onSocketError(QAbstractSocket::SocketError error);

private:
    QTcpSocket *socket_ = nullptr;
};

#endif // TCPFTPSOCKET_H
