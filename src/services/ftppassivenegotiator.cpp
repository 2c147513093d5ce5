#include "ftppassivenegotiator.h"

#include <QRegularExpression>

#include "ftpcontrolchannel.h"

FtpPassiveNegotiator::FtpPassiveNegotiator(FtpControlChannel *channel, FtpSocketFactory socketFactory)
    : channel_(channel)
    , socketFactory_(std::move(socketFactory))
{
}

void FtpPassiveNegotiator::negotiate(PassiveHandler handler)
{
    channel_->sendCommand(QStringLiteral("PASV"), false,
        [handler](const std::optional<FtpError> &error, const FtpReply &reply) {
            if (error) {
                handler(error, FtpPassiveEndpoint());
                return;
            }

            FtpPassiveEndpoint endpoint;
            if (!parsePassiveReply(reply.message, endpoint)) {
                handler(FtpError::make(FtpErrorKind::MalformedPassiveReply,
                                       QString("Failed to parse PASV response: %1").arg(reply.message),
                                       reply.code),
                        FtpPassiveEndpoint());
                return;
            }
            handler(std::nullopt, endpoint);
        });
}

IFtpSocket *FtpPassiveNegotiator::openDataChannel(const FtpPassiveEndpoint &endpoint,
                                                  QObject *parent) const
{
    QString host = endpoint.host;
    if (!channel_->config().usePassiveHost) {
        // Use the control socket's peer address instead of the IP from PASV
        const QString peer = channel_->socket()->peerAddress();
        if (!peer.isEmpty()) {
            host = peer;
        }
    }

    channel_->config().log(QString("Opening data connection to %1:%2 (PASV advertised %3)")
                               .arg(host)
                               .arg(endpoint.port)
                               .arg(endpoint.host));

    IFtpSocket *socket = socketFactory_(parent);
    socket->setLowDelay(true);
    socket->connectToHost(host, endpoint.port);
    return socket;
}

bool FtpPassiveNegotiator::parsePassiveReply(const QString &text, FtpPassiveEndpoint &endpoint)
{
    // Usual answer is "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)",
    // anonftpd gives "227 =h1,h2,h3,h4,p1,p2"
    static const QRegularExpression parenRx(
        "\\((\\d+),(\\d+),(\\d+),(\\d+),(\\d+),(\\d+)\\)");
    static const QRegularExpression equalsRx(
        "=(\\d+),(\\d+),(\\d+),(\\d+),(\\d+),(\\d+)");

    QRegularExpressionMatch match = parenRx.match(text);
    if (!match.hasMatch()) {
        match = equalsRx.match(text);
    }
    if (!match.hasMatch()) {
        return false;
    }

    int values[6];
    for (int i = 0; i < 6; ++i) {
        bool ok = false;
        values[i] = match.captured(i + 1).toInt(&ok);
        if (!ok || values[i] > 255) {
            return false;
        }
    }

    endpoint.host = QString("%1.%2.%3.%4")
                        .arg(values[0])
                        .arg(values[1])
                        .arg(values[2])
                        .arg(values[3]);
    endpoint.port = static_cast<quint16>((values[4] * PassivePortMultiplier) + values[5]);
    return true;
}
