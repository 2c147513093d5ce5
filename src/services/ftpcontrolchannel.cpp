#include "ftpcontrolchannel.h"

#include <QDebug>
#include <QPointer>

#include "iftpsocket.h"

FtpControlChannel::FtpControlChannel(IFtpSocket *socket, const FtpClientConfig &config,
                                     QObject *parent)
    : QObject(parent)
    , socket_(socket)
    , config_(config)
    , deadlineTimer_(new QTimer(this))
{
    deadlineTimer_->setSingleShot(true);
    connect(deadlineTimer_, &QTimer::timeout,
            this, &FtpControlChannel::onDeadlineExpired);

    connect(socket_, &IFtpSocket::readyRead,
            this, &FtpControlChannel::onReadyRead);
    connect(socket_, &IFtpSocket::disconnected,
            this, &FtpControlChannel::onSocketDisconnected);
    connect(socket_, &IFtpSocket::errorOccurred,
            this, &FtpControlChannel::onSocketError);
}

FtpControlChannel::~FtpControlChannel()
{
    // Handlers may capture objects that are being torn down alongside us
    pending_.reset();
}

void FtpControlChannel::sendCommand(const QString &command, bool tolerantOfPreliminary,
                                    ReplyHandler handler, int timeoutMs)
{
    const QString masked = maskCommand(command);

    if (!socket_->isConnected()) {
        config_.log(QString("Cannot send %1, socket not connected").arg(masked));
        handler(FtpError::make(FtpErrorKind::NotConnected,
                               QString("Not connected (command: %1)").arg(masked)),
                FtpReply());
        return;
    }

    if (pending_) {
        qWarning() << "FTP: refusing to send" << masked
                   << "while" << pending_->command << "is awaiting its reply";
        handler(FtpError::make(FtpErrorKind::ProtocolViolation,
                               QString("Command %1 sent while %2 is still pending")
                                   .arg(masked, pending_->command)),
                FtpReply());
        return;
    }

    ++commandCount_;
    lastCommand_ = masked;

    // Register before writing: a transport may deliver the reply synchronously
    registerPending(masked, tolerantOfPreliminary, std::move(handler), timeoutMs);

    config_.log(QString(">> %1").arg(masked));
    emit commandSent(masked);

    if (socket_->write((command + "\r\n").toUtf8()) < 0) {
        failPending(FtpError::make(FtpErrorKind::ConnectionError,
                                   QString("Failed to write %1: %2").arg(masked, socket_->errorString())));
    }
}

void FtpControlChannel::expectReply(const QString &description, ReplyHandler handler, int timeoutMs)
{
    if (pending_) {
        qWarning() << "FTP: cannot await" << description
                   << "while" << pending_->command << "is awaiting its reply";
        handler(FtpError::make(FtpErrorKind::ProtocolViolation,
                               QString("Awaiting %1 while %2 is still pending")
                                   .arg(description, pending_->command)),
                FtpReply());
        return;
    }
    registerPending(description, false, std::move(handler), timeoutMs);
}

void FtpControlChannel::registerPending(const QString &maskedCommand, bool tolerant,
                                        ReplyHandler handler, int timeoutMs)
{
    PendingCommand pending;
    pending.command = maskedCommand;
    pending.tolerantOfPreliminary = tolerant;
    pending.handler = std::move(handler);
    pending_ = std::move(pending);

    deadlineTimer_->start(timeoutMs > 0 ? timeoutMs : config_.commandTimeoutMs);
}

void FtpControlChannel::touchDeadline()
{
    if (pending_) {
        deadlineTimer_->start();
    }
}

void FtpControlChannel::abandonPending(const QString &reason)
{
    if (!pending_) {
        return;
    }
    config_.log(QString("Abandoning %1: %2").arg(pending_->command, reason));
    deadlineTimer_->stop();
    pending_.reset();
    draining_ = true;
}

void FtpControlChannel::failPending(const FtpError &error)
{
    if (pending_) {
        resolvePending(error, FtpReply());
    }
}

void FtpControlChannel::reset()
{
    deadlineTimer_->stop();
    parser_.reset();
    queuedLines_.clear();
    draining_ = false;
    authenticated_ = false;
}

void FtpControlChannel::onReadyRead()
{
    queuedLines_.append(parser_.feed(socket_->readAll()));

    // A handler may trigger another readyRead; lines must still be handled in order
    if (processingLines_) {
        return;
    }

    QPointer<FtpControlChannel> guard(this);
    processingLines_ = true;
    while (!queuedLines_.isEmpty()) {
        handleLine(queuedLines_.takeFirst());
        if (!guard) {
            return;
        }
    }
    processingLines_ = false;
}

void FtpControlChannel::handleLine(const QString &line)
{
    emit replyLineReceived(line);

    FtpReplyLine reply;
    switch (parser_.accept(line, &reply)) {
    case FtpReplyParser::Result::Malformed:
        qWarning() << "FTP: malformed reply line:" << line;
        if (pending_) {
            resolvePending(FtpError::make(FtpErrorKind::MalformedReply,
                                          QString("Cannot parse reply to %1: %2")
                                              .arg(pending_->command, line)),
                           FtpReply());
        }
        break;

    case FtpReplyParser::Result::Continuation:
        config_.log(QString("<< %1").arg(line));
        break;

    case FtpReplyParser::Result::Terminal:
        config_.log(QString("<< %1").arg(line));
        handleTerminalLine(reply);
        break;
    }
}

void FtpControlChannel::handleTerminalLine(const FtpReplyLine &line)
{
    // Replies are strictly ordered: the first non-1xx one after an abandoned
    // transfer is either that transfer's late completion or already the next reply.
    // A 1xx can only announce the abandoned transfer, so the drain stays open.
    if (draining_ && line.isPreliminary()) {
        config_.log(QString("Drained late preliminary reply: %1").arg(line.raw));
        return;
    }
    if (draining_) {
        draining_ = false;
        if (isLateTransferReply(line.code)) {
            config_.log(QString("Drained late transfer reply: %1").arg(line.raw));
            return;
        }
    }

    if (!pending_) {
        if (line.code == FtpReply::ServiceClosing) {
            emit serverClosing(line.message);
        }
        qDebug() << "FTP: dropping unsolicited reply:" << line.raw;
        return;
    }

    FtpReply reply{line.code, line.message};

    if (line.isPreliminary()) {
        if (pending_->tolerantOfPreliminary) {
            config_.log(QString("Preliminary reply to %1, waiting for completion").arg(pending_->command));
            deadlineTimer_->start();
            emit preliminaryReceived(reply);
            return;
        }
        // A final reply will follow; drain it so it cannot answer the next command
        draining_ = true;
        resolvePending(FtpError::make(FtpErrorKind::ServerError,
                                      QString("Unexpected preliminary reply: %1").arg(line.message),
                                      line.code),
                       reply);
        return;
    }

    if (line.isSuccess()) {
        resolvePending(std::nullopt, reply);
    } else {
        config_.log(QString("Error response: %1").arg(line.code));
        resolvePending(FtpError::fromReply(line), reply);
    }
}

void FtpControlChannel::resolvePending(const std::optional<FtpError> &error, const FtpReply &reply)
{
    deadlineTimer_->stop();
    PendingCommand finished = std::move(*pending_);
    pending_.reset();

    // Slot is free before the handler runs so it may send the next command
    if (finished.handler) {
        finished.handler(error, reply);
    }
}

void FtpControlChannel::onDeadlineExpired()
{
    if (!pending_) {
        return;
    }
    qDebug() << "FTP: command timeout:" << pending_->command;
    resolvePending(FtpError::make(FtpErrorKind::CommandTimeout,
                                  QString("Command timeout: %1").arg(pending_->command)),
                   FtpReply());
}

void FtpControlChannel::onSocketDisconnected()
{
    qDebug() << "FTP: Control socket disconnected";
    reset();
    failPending(FtpError::make(FtpErrorKind::ConnectionError,
                               QStringLiteral("Control connection closed")));
    emit connectionLost(QStringLiteral("Control connection closed"));
}

void FtpControlChannel::onSocketError(const QString &message, bool remoteClosed)
{
    qDebug() << "FTP: Control socket error:" << message;
    if (remoteClosed) {
        // disconnected() follows and does the cleanup
        return;
    }
    reset();
    failPending(FtpError::make(FtpErrorKind::ConnectionError, message));
    emit connectionLost(message);
}

QString FtpControlChannel::maskCommand(const QString &command)
{
    if (command.startsWith(QLatin1String("PASS "), Qt::CaseInsensitive)) {
        return QStringLiteral("PASS ********");
    }
    return command;
}

bool FtpControlChannel::isLateTransferReply(int code)
{
    return code == 225 || code == FtpReply::TransferComplete || code == 426;
}
