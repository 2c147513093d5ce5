#include "tcpftpsocket.h"

#include <QHostAddress>

TcpFtpSocket::TcpFtpSocket(QObject *parent)
    : IFtpSocket(parent)
    , socket_(new QTcpSocket(this))
{
    connect(socket_, &QTcpSocket::connected,
            this, &IFtpSocket::connected);
    connect(socket_, &QTcpSocket::readyRead,
            this, &IFtpSocket::readyRead);
    connect(socket_, &QTcpSocket::bytesWritten,
            this, &IFtpSocket::bytesWritten);
    connect(socket_, &QTcpSocket::disconnected,
            this, &IFtpSocket::disconnected);
    connect(socket_, &QTcpSocket::errorOccurred,
            this, &TcpFtpSocket::onSocketError);
}

void TcpFtpSocket::connectToHost(const QString &host, quint16 port)
{
    socket_->connectToHost(host, port);
}

qint64 TcpFtpSocket::write(const QByteArray &data)
{
    return socket_->write(data);
}

void TcpFtpSocket::disconnectFromHost()
{
    socket_->disconnectFromHost();
}

void TcpFtpSocket::abort()
{
    socket_->abort();
}

bool TcpFtpSocket::isConnected() const
{
    return socket_->state() == QAbstractSocket::ConnectedState;
}

QString TcpFtpSocket::peerAddress() const
{
    QHostAddress address = socket_->peerAddress();
    // Strip the IPv4-mapped prefix so the address can be reused for the data connection
    bool isIpv4 = false;
    const quint32 ipv4 = address.toIPv4Address(&isIpv4);
    if (isIpv4) {
        return QHostAddress(ipv4).toString();
    }
    return address.toString();
}

void TcpFtpSocket::setLowDelay(bool enabled)
{
    socket_->setSocketOption(QAbstractSocket::LowDelayOption, enabled ? 1 : 0);
}

void TcpFtpSocket::setKeepAlive(bool enabled)
{
    socket_->setSocketOption(QAbstractSocket::KeepAliveOption, enabled ? 1 : 0);
}

FtpSocketFactory TcpFtpSocket::factory()
{
    return [](QObject *parent) -> IFtpSocket * {
        return new TcpFtpSocket(parent);
    };
}

void TcpFtpSocket::onSocketError(QAbstractSocket::SocketError error)
{
    // RemoteHostClosedError is normal - server closes after sending data
    emit errorOccurred(socket_->errorString(),
                       error == QAbstractSocket::RemoteHostClosedError);
}
