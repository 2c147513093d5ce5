/**
 * @file ftppassivenegotiator.h
 * @brief PASV negotiation and data connection setup.
 */

#ifndef FTPPASSIVENEGOTIATOR_H
#define FTPPASSIVENEGOTIATOR_H

#include <QString>

#include <functional>
#include <optional>

#include "ftpreply.h"
#include "iftpsocket.h"

class FtpControlChannel;
class QObject;

/**
 * @brief Data endpoint advertised by a "227 Entering Passive Mode" reply.
 */
struct FtpPassiveEndpoint {
    QString host;      ///< Dotted IPv4 address h1.h2.h3.h4
    quint16 port = 0;  ///< p1 * 256 + p2
};

/// Completion callback of a PASV negotiation.
using PassiveHandler = std::function<void(const std::optional<FtpError> &error,
                                          const FtpPassiveEndpoint &endpoint)>;

/**
 * @brief Obtains a passive endpoint and opens data connections to it.
 *
 * The data connection is a raw byte pipe with no framing of its own; it is
 * connected but otherwise untouched here. Ownership of the returned socket
 * passes to the caller (normally one FtpTransfer).
 */
class FtpPassiveNegotiator
{
public:
    static constexpr int PassivePortMultiplier = 256;  ///< Multiplier for passive port calculation

    /**
     * @brief Constructs a negotiator.
     * @param channel Control channel used for PASV (not owned).
     * @param socketFactory Creates data sockets.
     */
    FtpPassiveNegotiator(FtpControlChannel *channel, FtpSocketFactory socketFactory);

    /**
     * @brief Sends PASV and decodes the advertised endpoint.
     * @param handler Receives the endpoint, MalformedPassiveReply, or the
     *        PASV command's own failure.
     */
    void negotiate(PassiveHandler handler);

    /**
     * @brief Creates a socket and starts connecting it to @p endpoint.
     *
     * When FtpClientConfig::usePassiveHost is false the control connection's
     * peer address is used instead of the advertised host, which helps with
     * servers behind NAT that advertise internal addresses.
     *
     * @param endpoint Endpoint from negotiate().
     * @param parent Owner of the new socket.
     */
    [[nodiscard]] IFtpSocket *openDataChannel(const FtpPassiveEndpoint &endpoint,
                                              QObject *parent) const;

    /**
     * @brief Extracts the endpoint from a PASV reply message.
     *
     * Accepts "(h1,h2,h3,h4,p1,p2)" anywhere in the text, and the
     * "=h1,h2,h3,h4,p1,p2" variant some servers send.
     *
     * @param text Reply message (with or without the leading code).
     * @param endpoint Receives the decoded host and port.
     * @return False if no six-number group in range 0..255 is present.
     */
    [[nodiscard]] static bool parsePassiveReply(const QString &text, FtpPassiveEndpoint &endpoint);

private:
    FtpControlChannel *channel_ = nullptr;
    FtpSocketFactory socketFactory_;
};

#endif // FTPPASSIVENEGOTIATOR_H
