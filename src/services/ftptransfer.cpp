#include "ftptransfer.h"

#include <QDebug>
#include <QIODevice>
#include <QRegularExpression>

#include "iftpsocket.h"

FtpTransfer::FtpTransfer(FtpControlChannel *channel, FtpPassiveNegotiator *negotiator,
                         Kind kind, const QString &remotePath, QObject *parent)
    : QObject(parent)
    , channel_(channel)
    , negotiator_(negotiator)
    , kind_(kind)
    , remotePath_(remotePath)
    , graceTimer_(new QTimer(this))
    , idleTimer_(new QTimer(this))
{
    graceTimer_->setSingleShot(true);
    connect(graceTimer_, &QTimer::timeout, this, &FtpTransfer::onGraceExpired);

    idleTimer_->setSingleShot(true);
    connect(idleTimer_, &QTimer::timeout, this, &FtpTransfer::onIdleExpired);
}

FtpTransfer::~FtpTransfer()
{
    if (!finished_) {
        // Destroyed mid-flight: free the command slot and drop the data connection
        abandonCommand(QStringLiteral("transfer destroyed"));
        releaseDataSocket(true);
    }
}

void FtpTransfer::setSource(QIODevice *source)
{
    source_ = source;
}

void FtpTransfer::setSink(QIODevice *sink)
{
    sink_ = sink;
}

void FtpTransfer::start()
{
    if (started_) {
        qWarning() << "FtpTransfer: start() called twice for" << commandFor(kind_, remotePath_);
        return;
    }
    started_ = true;

    if (kind_ == Kind::Store && (!source_ || !source_->isReadable())) {
        fail(FtpError::make(FtpErrorKind::LocalIoError,
                            QStringLiteral("Upload source is not open for reading")));
        return;
    }
    if (sink_ && !sink_->isWritable()) {
        fail(FtpError::make(FtpErrorKind::LocalIoError,
                            QStringLiteral("Download sink is not open for writing")));
        return;
    }
    if (!channel_) {
        fail(FtpError::make(FtpErrorKind::NotConnected, QStringLiteral("No control channel")));
        return;
    }

    if (kind_ == Kind::Store && expectedSize_ <= 0 && !source_->isSequential()) {
        expectedSize_ = source_->size() - source_->pos();
    }

    QPointer<FtpTransfer> guard(this);
    negotiator_->negotiate([guard](const std::optional<FtpError> &error,
                                   const FtpPassiveEndpoint &endpoint) {
        if (guard) {
            guard->onPassiveNegotiated(error, endpoint);
        }
    });
}

void FtpTransfer::abort(const QString &reason)
{
    if (finished_) {
        return;
    }
    fail(FtpError::make(FtpErrorKind::DataChannelError,
                        QString("Transfer aborted: %1").arg(reason)));
}

void FtpTransfer::onPassiveNegotiated(const std::optional<FtpError> &error,
                                      const FtpPassiveEndpoint &endpoint)
{
    if (finished_) {
        return;
    }
    if (error) {
        fail(*error);
        return;
    }

    setState(State::PassiveNegotiated);

    dataSocket_ = negotiator_->openDataChannel(endpoint, this);
    connect(dataSocket_, &IFtpSocket::connected, this, &FtpTransfer::onDataConnected);
    connect(dataSocket_, &IFtpSocket::readyRead, this, &FtpTransfer::onDataReadyRead);
    connect(dataSocket_, &IFtpSocket::bytesWritten, this, &FtpTransfer::onDataBytesWritten);
    connect(dataSocket_, &IFtpSocket::disconnected, this, &FtpTransfer::onDataDisconnected);
    connect(dataSocket_, &IFtpSocket::errorOccurred, this, &FtpTransfer::onDataError);

    idleTimer_->start(channel_->config().connectTimeoutMs);
}

void FtpTransfer::onDataConnected()
{
    if (finished_) {
        return;
    }
    idleTimer_->start(channel_->config().commandTimeoutMs);
    setState(State::DataChannelOpen);
    issueCommand();
}

void FtpTransfer::issueCommand()
{
    const QString command = commandFor(kind_, remotePath_);

    // Only one command can be outstanding, so any preliminary reply is ours
    connect(channel_, &FtpControlChannel::preliminaryReceived,
            this, &FtpTransfer::onPreliminaryReply, Qt::UniqueConnection);

    commandIssued_ = true;
    setState(State::CommandIssued);

    QPointer<FtpTransfer> guard(this);
    channel_->sendCommand(command, true,
        [guard](const std::optional<FtpError> &error, const FtpReply &reply) {
            if (guard) {
                guard->onControlReply(error, reply);
            }
        });

    if (finished_) {
        return;
    }
    if (kind_ == Kind::Store) {
        writeNextChunk();
    }
}

void FtpTransfer::onPreliminaryReply(const FtpReply &reply)
{
    if (finished_ || controlReplied_) {
        return;
    }
    if (expectedSize_ <= 0) {
        const qint64 announced = parseAnnouncedSize(reply.message);
        if (announced >= 0) {
            expectedSize_ = announced;
        }
    }
}

void FtpTransfer::writeNextChunk()
{
    if (finished_ || uploadComplete_ || !dataSocket_) {
        return;
    }

    const QByteArray chunk = source_->read(channel_->config().transferChunkSize);
    if (chunk.isEmpty()) {
        if (!source_->atEnd()) {
            fail(FtpError::make(FtpErrorKind::LocalIoError,
                                QString("Failed to read upload source: %1").arg(source_->errorString())));
            return;
        }
        // Closing the data connection marks end of file for STOR
        uploadComplete_ = true;
        channel_->config().log(QString("Upload of %1 complete (%2 bytes), closing data connection")
                                   .arg(remotePath_)
                                   .arg(bytes_));
        dataSocket_->disconnectFromHost();
        return;
    }

    if (dataSocket_->write(chunk) < 0) {
        fail(FtpError::make(FtpErrorKind::DataChannelError,
                            QString("Failed to write to data connection: %1").arg(dataSocket_->errorString())));
        return;
    }

    bytes_ += chunk.size();
    if (state_ < State::DataInFlight) {
        setState(State::DataInFlight);
    }
    idleTimer_->start(channel_->config().commandTimeoutMs);
    if (!controlReplied_) {
        channel_->touchDeadline();
    }
    emit progress(bytes_, expectedSize_);
}

void FtpTransfer::onDataBytesWritten(qint64 bytes)
{
    Q_UNUSED(bytes)
    if (finished_ || kind_ != Kind::Store || !dataSocket_) {
        return;
    }
    idleTimer_->start(channel_->config().commandTimeoutMs);
    if (dataSocket_->bytesToWrite() == 0) {
        writeNextChunk();
    }
}

void FtpTransfer::onDataReadyRead()
{
    if (finished_) {
        return;
    }
    readAvailable();
}

void FtpTransfer::readAvailable()
{
    if (!dataSocket_) {
        return;
    }
    const QByteArray data = dataSocket_->readAll();
    if (data.isEmpty() || kind_ == Kind::Store) {
        return;
    }

    bytes_ += data.size();
    if (sink_) {
        if (sink_->write(data) != data.size()) {
            fail(FtpError::make(FtpErrorKind::LocalIoError,
                                QString("Failed to write download data: %1").arg(sink_->errorString())));
            return;
        }
    } else {
        buffer_.append(data);
    }

    if (state_ < State::DataInFlight) {
        setState(State::DataInFlight);
    }
    idleTimer_->start(channel_->config().commandTimeoutMs);
    if (!controlReplied_) {
        channel_->touchDeadline();
    }
    emit progress(bytes_, expectedSize_);
}

void FtpTransfer::onDataDisconnected()
{
    if (finished_ || dataClosed_) {
        return;
    }

    // Read any remaining data before marking the channel closed
    readAvailable();
    if (finished_) {
        return;
    }

    dataClosed_ = true;
    idleTimer_->stop();
    channel_->config().log(QString("Data connection closed for %1 (%2 bytes)")
                               .arg(remotePath_)
                               .arg(bytes_));

    if (!commandIssued_) {
        fail(FtpError::make(FtpErrorKind::DataChannelError,
                            QStringLiteral("Data connection closed before the transfer started")));
        return;
    }
    if (kind_ == Kind::Store && !uploadComplete_) {
        // Usually followed by an error reply explaining why (quota, permissions)
        prematureClose_ = true;
    }

    setState(State::DataChannelClosed);
    evaluateJoin();
}

void FtpTransfer::onDataError(const QString &message, bool remoteClosed)
{
    if (finished_) {
        return;
    }
    if (remoteClosed) {
        // Normal end of a download; disconnected() follows
        readAvailable();
        return;
    }
    fail(FtpError::make(FtpErrorKind::DataChannelError,
                        QString("Data connection error: %1").arg(message)));
}

void FtpTransfer::onControlReply(const std::optional<FtpError> &error, const FtpReply &reply)
{
    if (finished_) {
        return;
    }
    controlReplied_ = true;
    controlReply_ = reply;
    graceTimer_->stop();

    if (error) {
        fail(*error);
        return;
    }

    channel_->config().log(QString("Completion reply for %1: %2 %3")
                               .arg(remotePath_)
                               .arg(reply.code)
                               .arg(reply.message));
    setState(State::ControlReplyReceived);
    evaluateJoin();
}

void FtpTransfer::evaluateJoin()
{
    if (finished_ || !dataClosed_) {
        return;
    }

    if (controlReplied_) {
        if (prematureClose_) {
            fail(FtpError::make(FtpErrorKind::DataChannelError,
                                QStringLiteral("Data connection closed before the upload completed")));
            return;
        }
        succeed(true);
        return;
    }

    const int grace = channel_->config().completionGraceMs;
    if (grace > 0 && !graceTimer_->isActive()) {
        graceTimer_->start(grace);
    }
}

void FtpTransfer::onGraceExpired()
{
    if (finished_ || controlReplied_) {
        return;
    }

    setState(State::SecondaryTimeout);
    qWarning() << "FTP: no completion reply for" << commandFor(kind_, remotePath_)
               << "within" << channel_->config().completionGraceMs
               << "ms after the data connection closed";
    abandonCommand(QStringLiteral("completion grace period elapsed"));

    if (prematureClose_) {
        fail(FtpError::make(FtpErrorKind::DataChannelError,
                            QStringLiteral("Data connection closed before the upload completed")));
        return;
    }
    succeed(false);
}

void FtpTransfer::onIdleExpired()
{
    if (finished_) {
        return;
    }
    if (!commandIssued_) {
        fail(FtpError::make(FtpErrorKind::DataChannelError,
                            QStringLiteral("Timed out opening data connection")));
        return;
    }
    fail(FtpError::make(FtpErrorKind::DataChannelError,
                        QString("Data connection idle for %1 ms")
                            .arg(channel_->config().commandTimeoutMs)));
}

void FtpTransfer::succeed(bool confirmed)
{
    releaseDataSocket(false);
    setState(State::Resolved);

    FtpTransferResult result;
    result.bytesTransferred = bytes_;
    result.confirmed = confirmed;
    if (confirmed) {
        result.reply = controlReply_;
    }
    if (!sink_) {
        result.data = buffer_;
    }
    finish(std::move(result));
}

void FtpTransfer::fail(const FtpError &error)
{
    if (finished_) {
        return;
    }

    abandonCommand(error.message);
    releaseDataSocket(true);
    setState(State::Failed);

    FtpTransferResult result;
    result.error = error.path.isEmpty() ? error.withPath(remotePath_) : error;
    result.bytesTransferred = bytes_;
    qDebug() << "FTP: transfer failed:" << result.error->toString();
    finish(std::move(result));
}

void FtpTransfer::finish(FtpTransferResult result)
{
    finished_ = true;
    graceTimer_->stop();
    idleTimer_->stop();
    if (channel_) {
        disconnect(channel_, &FtpControlChannel::preliminaryReceived,
                   this, &FtpTransfer::onPreliminaryReply);
    }
    emit finished(result);
}

void FtpTransfer::setState(State state)
{
    if (state_ == state) {
        return;
    }
    state_ = state;
    emit stateChanged(state);
}

void FtpTransfer::releaseDataSocket(bool abortConnection)
{
    if (!dataSocket_) {
        return;
    }
    disconnect(dataSocket_, nullptr, this, nullptr);
    if (abortConnection && dataSocket_->isConnected()) {
        dataSocket_->abort();
    }
    dataSocket_->deleteLater();
    dataSocket_ = nullptr;
}

void FtpTransfer::abandonCommand(const QString &reason)
{
    if (!commandIssued_ || controlReplied_ || commandAbandoned_ || !channel_) {
        return;
    }
    commandAbandoned_ = true;
    channel_->abandonPending(reason);
}

QString FtpTransfer::commandFor(Kind kind, const QString &remotePath)
{
    switch (kind) {
    case Kind::Store:
        return QStringLiteral("STOR ") + remotePath;
    case Kind::Retrieve:
        return QStringLiteral("RETR ") + remotePath;
    case Kind::List:
        return remotePath.isEmpty() ? QStringLiteral("LIST") : QStringLiteral("LIST ") + remotePath;
    }
    return QString();
}

qint64 FtpTransfer::parseAnnouncedSize(const QString &message)
{
    static const QRegularExpression rx("\\((\\d+)\\s+bytes\\)");
    const QRegularExpressionMatch match = rx.match(message);
    if (!match.hasMatch()) {
        return -1;
    }
    bool ok = false;
    const qint64 size = match.captured(1).toLongLong(&ok);
    return ok ? size : -1;
}
