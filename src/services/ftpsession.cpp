#include "ftpsession.h"

#include <QBuffer>
#include <QDebug>
#include <QFile>
#include <QRegularExpression>

#include "ftpcontrolchannel.h"
#include "ftpdirectoryoperator.h"
#include "ftplistingparser.h"
#include "tcpftpsocket.h"

FtpSession::FtpSession(QObject *parent)
    : FtpSession(FtpClientConfig(), TcpFtpSocket::factory(), parent)
{
}

FtpSession::FtpSession(const FtpClientConfig &config, FtpSocketFactory socketFactory,
                       QObject *parent)
    : IFtpClient(parent)
    , config_(config)
    , socketFactory_(std::move(socketFactory))
    , connectTimer_(new QTimer(this))
{
    config_.sanitize();

    connectTimer_->setSingleShot(true);
    connect(connectTimer_, &QTimer::timeout,
            this, &FtpSession::onConnectTimeout);
}

FtpSession::~FtpSession()
{
    // Callbacks capture this session; make sure none can run during teardown.
    // The transfer, channel and control socket are children and die with the session.
    connectHandler_ = nullptr;
    if (activeTransfer_) {
        QObject::disconnect(activeTransfer_, nullptr, this, nullptr);
        activeTransfer_->abort(QStringLiteral("session destroyed"));
    }
    negotiator_.reset();
    if (channel_) {
        QObject::disconnect(channel_, nullptr, this, nullptr);
    }
    if (controlSocket_) {
        // The socket is destroyed before the channel, so nothing may observe it any more
        QObject::disconnect(controlSocket_, nullptr, nullptr, nullptr);
        controlSocket_->abort();
    }
}

void FtpSession::setHost(const QString &host, quint16 port)
{
    host_ = host;
    port_ = port;
}

void FtpSession::setCredentials(const QString &user, const QString &password)
{
    user_ = user.isEmpty() ? QStringLiteral("anonymous") : user;
    password_ = password.isEmpty() ? QStringLiteral("anonymous@") : password;
}

bool FtpSession::isLoggedIn() const
{
    return channel_ && channel_->isAuthenticated();
}

void FtpSession::setState(State state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

// Connection and login

void FtpSession::connectToHost(DoneHandler handler)
{
    if (state_ != State::Disconnected) {
        qDebug() << "FTP: connectToHost called but state is" << static_cast<int>(state_);
        const FtpError failure = FtpError::make(
            FtpErrorKind::ConnectionError,
            QStringLiteral("Cannot connect: connection already in progress or established"));
        emit error(failure.toString());
        if (handler) {
            handler(failure);
        }
        return;
    }

    teardown();

    controlSocket_ = socketFactory_(this);
    channel_ = new FtpControlChannel(controlSocket_, config_, this);
    negotiator_ = std::make_unique<FtpPassiveNegotiator>(channel_, socketFactory_);

    connect(controlSocket_, &IFtpSocket::connected,
            this, &FtpSession::onControlConnected);
    connect(channel_, &FtpControlChannel::connectionLost,
            this, &FtpSession::onConnectionLost);
    connect(channel_, &FtpControlChannel::serverClosing,
            this, &FtpSession::onServerClosing);
    connect(channel_, &FtpControlChannel::commandSent,
            this, &FtpSession::commandSent);
    connect(channel_, &FtpControlChannel::replyLineReceived,
            this, &FtpSession::replyLineReceived);

    connectHandler_ = std::move(handler);
    currentDirectory_ = QStringLiteral("/");

    qDebug() << "FTP: Connecting to" << host_ << ":" << port_;
    config_.log(QString("Connecting to %1:%2 as %3").arg(host_).arg(port_).arg(user_));
    setState(State::Connecting);

    // Start connection timeout timer
    connectTimer_->start(config_.connectTimeoutMs);

    controlSocket_->connectToHost(host_, port_);
}

void FtpSession::onControlConnected()
{
    config_.log(QStringLiteral("TCP connection established"));
    controlSocket_->setKeepAlive(config_.keepAlive);
    controlSocket_->setLowDelay(true);
    setState(State::Connected);

    // The greeting is the first reply; it counts against the connect deadline
    const int remaining = connectTimer_->isActive() ? connectTimer_->remainingTime()
                                                    : config_.connectTimeoutMs;
    connectTimer_->stop();

    channel_->expectReply(QStringLiteral("server greeting"),
        [this](const std::optional<FtpError> &failure, const FtpReply &reply) {
            if (failure) {
                finishConnect(failure);
                return;
            }
            config_.log(QString("Server greeting: %1 %2").arg(reply.code).arg(reply.message));
            login();
        },
        qMax(remaining, 1));
}

void FtpSession::login()
{
    setState(State::LoggingIn);
    config_.log(QStringLiteral("Authenticating..."));

    channel_->sendCommand(QString("USER %1").arg(user_), false,
        [this](const std::optional<FtpError> &failure, const FtpReply &reply) {
            if (failure) {
                finishConnect(failure);
                return;
            }
            if (reply.code == FtpReply::PasswordRequired) {
                sendPassword();
                return;
            }
            if (reply.code / 100 == 2) {
                finishConnect(std::nullopt);
                return;
            }
            finishConnect(FtpError::make(FtpErrorKind::ServerError,
                                         QString("Unexpected reply to USER: %1").arg(reply.message),
                                         reply.code));
        },
        config_.connectTimeoutMs);
}

void FtpSession::sendPassword()
{
    channel_->sendCommand(QString("PASS %1").arg(password_), false,
        [this](const std::optional<FtpError> &failure, const FtpReply &reply) {
            if (failure) {
                finishConnect(failure);
                return;
            }
            if (reply.code / 100 != 2) {
                finishConnect(FtpError::make(FtpErrorKind::ServerError,
                                             QString("Login not completed: %1").arg(reply.message),
                                             reply.code));
                return;
            }
            finishConnect(std::nullopt);
        },
        config_.connectTimeoutMs);
}

void FtpSession::finishConnect(const std::optional<FtpError> &failure)
{
    connectTimer_->stop();
    DoneHandler handler = std::move(connectHandler_);
    connectHandler_ = nullptr;

    if (failure) {
        qDebug() << "FTP: Login failed:" << failure->toString();
        teardown();
        setState(State::Disconnected);
        emit error(failure->toString());
    } else {
        channel_->setAuthenticated(true);
        config_.log(QStringLiteral("Authentication successful"));
        setState(State::Ready);
        emit connected();
    }

    if (handler) {
        handler(failure);
    }
}

void FtpSession::onConnectTimeout()
{
    qDebug() << "FTP: Connection timeout";
    finishConnect(FtpError::make(FtpErrorKind::ConnectionError,
                                 QString("Connection timeout after %1 ms").arg(config_.connectTimeoutMs)));
}

void FtpSession::onConnectionLost(const QString &reason)
{
    if (state_ == State::Connecting || state_ == State::Connected || state_ == State::LoggingIn) {
        finishConnect(FtpError::make(FtpErrorKind::ConnectionError, reason));
        return;
    }
    if (state_ == State::Disconnected) {
        return;
    }

    qDebug() << "FTP: Connection lost:" << reason;
    teardown();
    setState(State::Disconnected);
    emit error(QString("Connection lost: %1").arg(reason));
    emit disconnected();
}

void FtpSession::onServerClosing(const QString &message)
{
    qWarning() << "FTP: server is closing the connection:" << message;
    emit error(QString("Server closing connection: %1").arg(message));
}

void FtpSession::teardown()
{
    if (activeTransfer_) {
        activeTransfer_->abort(QStringLiteral("session closed"));
    }
    negotiator_.reset();
    if (channel_) {
        QObject::disconnect(channel_, nullptr, this, nullptr);
        channel_->deleteLater();
        channel_ = nullptr;
    }
    if (controlSocket_) {
        QObject::disconnect(controlSocket_, nullptr, this, nullptr);
        if (controlSocket_->isConnected()) {
            controlSocket_->disconnectFromHost();
        }
        controlSocket_->deleteLater();
        controlSocket_ = nullptr;
    }
}

void FtpSession::close(DoneHandler handler)
{
    if (!channel_ || !controlSocket_ || !controlSocket_->isConnected()) {
        teardown();
        setState(State::Disconnected);
        if (handler) {
            handler(std::nullopt);
        }
        return;
    }

    config_.log(QStringLiteral("Closing connection..."));
    if (activeTransfer_) {
        activeTransfer_->abort(QStringLiteral("session closing"));
    }

    channel_->sendCommand(QStringLiteral("QUIT"), false,
        [this, handler](const std::optional<FtpError> &failure, const FtpReply &) {
            if (failure) {
                config_.log(QString("Error during QUIT: %1").arg(failure->toString()));
            }
            connectHandler_ = nullptr;
            teardown();
            setState(State::Disconnected);
            config_.log(QStringLiteral("Connection closed"));
            emit disconnected();
            if (handler) {
                handler(std::nullopt);
            }
        });
}

void FtpSession::disconnect()
{
    close(nullptr);
}

void FtpSession::abort()
{
    if (!activeTransfer_) {
        return;
    }
    activeTransfer_->abort(QStringLiteral("aborted by user"));

    if (channel_ && controlSocket_ && controlSocket_->isConnected() && !channel_->hasPendingCommand()) {
        channel_->sendCommand(QStringLiteral("ABOR"), false,
            [this](const std::optional<FtpError> &failure, const FtpReply &) {
                if (failure) {
                    config_.log(QString("ABOR: %1").arg(failure->toString()));
                }
            },
            AbortTimeoutMs);
    }
}

// Command layer

std::optional<FtpError> FtpSession::checkReady(const QString &path) const
{
    if (!channel_ || !isLoggedIn() || !isConnected()) {
        return FtpError::make(FtpErrorKind::NotConnected,
                              QStringLiteral("Not connected to FTP server")).withPath(path);
    }
    if (state_ == State::Busy) {
        return FtpError::make(FtpErrorKind::ProtocolViolation,
                              QStringLiteral("Session is busy with a transfer")).withPath(path);
    }
    return std::nullopt;
}

void FtpSession::reportError(const FtpError &failure)
{
    emit error(failure.toString());
}

void FtpSession::runCommand(const QString &command, const QString &path, ReplyHandler handler)
{
    if (const auto notReady = checkReady(path)) {
        reportError(*notReady);
        handler(notReady, FtpReply());
        return;
    }

    channel_->sendCommand(command, false,
        [this, path, handler](const std::optional<FtpError> &failure, const FtpReply &reply) {
            if (failure) {
                const FtpError withContext = failure->path.isEmpty() && !path.isEmpty()
                                                 ? failure->withPath(path)
                                                 : *failure;
                reportError(withContext);
                handler(withContext, reply);
                return;
            }
            handler(std::nullopt, reply);
        });
}

void FtpSession::runSimpleCommand(const QString &command, const QString &path, DoneHandler handler)
{
    runCommand(command, path,
        [handler](const std::optional<FtpError> &failure, const FtpReply &) {
            if (handler) {
                handler(failure);
            }
        });
}

void FtpSession::sendCommand(const QString &command, bool tolerantOfPreliminary, ReplyHandler handler)
{
    if (!channel_) {
        handler(FtpError::make(FtpErrorKind::NotConnected,
                               QStringLiteral("Not connected to FTP server")),
                FtpReply());
        return;
    }
    if (state_ == State::Busy) {
        handler(FtpError::make(FtpErrorKind::ProtocolViolation,
                               QStringLiteral("Session is busy with a transfer")),
                FtpReply());
        return;
    }
    channel_->sendCommand(command, tolerantOfPreliminary, std::move(handler));
}

void FtpSession::negotiatePassive(PassiveHandler handler)
{
    if (const auto notReady = checkReady(QString())) {
        handler(notReady, FtpPassiveEndpoint());
        return;
    }
    negotiator_->negotiate(std::move(handler));
}

void FtpSession::changeDirectory(const QString &path, DoneHandler handler)
{
    runCommand(QString("CWD %1").arg(path), path,
        [this, path, handler](const std::optional<FtpError> &failure, const FtpReply &) {
            if (!failure) {
                currentDirectory_ = path.startsWith('/')
                                        ? FtpListingParser::normalizePath(path)
                                        : FtpListingParser::normalizePath(
                                              FtpListingParser::joinPath(currentDirectory_, path));
            }
            if (handler) {
                handler(failure);
            }
        });
}

void FtpSession::printWorkingDirectory(PathHandler handler)
{
    runCommand(QStringLiteral("PWD"), QString(),
        [handler](const std::optional<FtpError> &failure, const FtpReply &reply) {
            if (failure) {
                handler(failure, QString());
                return;
            }
            handler(std::nullopt, parsePwdReply(reply.message));
        });
}

QString FtpSession::parsePwdReply(const QString &message)
{
    static const QRegularExpression rx("\"((?:[^\"]|\"\")+)\"");
    const QRegularExpressionMatch match = rx.match(message);
    if (!match.hasMatch()) {
        return QStringLiteral("/");
    }
    QString path = match.captured(1);
    path.replace(QLatin1String("\"\""), QLatin1String("\""));
    return path;
}

void FtpSession::makeDirectory(const QString &path, DoneHandler handler)
{
    runSimpleCommand(QString("MKD %1").arg(path), path, std::move(handler));
}

void FtpSession::removeDirectory(const QString &path, DoneHandler handler)
{
    runSimpleCommand(QString("RMD %1").arg(path), path, std::move(handler));
}

void FtpSession::remove(const QString &path, DoneHandler handler)
{
    runSimpleCommand(QString("DELE %1").arg(path), path, std::move(handler));
}

void FtpSession::rename(const QString &oldPath, const QString &newPath, DoneHandler handler)
{
    runCommand(QString("RNFR %1").arg(oldPath), oldPath,
        [this, oldPath, newPath, handler](const std::optional<FtpError> &failure, const FtpReply &reply) {
            if (failure) {
                if (handler) {
                    handler(failure);
                }
                return;
            }
            if (reply.code != FtpReply::PendingFurtherInfo) {
                const FtpError unexpected = FtpError::make(
                    FtpErrorKind::ServerError,
                    QString("RNFR not accepted: %1").arg(reply.message), reply.code).withPath(oldPath);
                reportError(unexpected);
                if (handler) {
                    handler(unexpected);
                }
                return;
            }
            runSimpleCommand(QString("RNTO %1").arg(newPath), newPath, handler);
        });
}

void FtpSession::size(const QString &path, SizeHandler handler)
{
    config_.log(QString("Getting size of %1").arg(path));
    runCommand(QString("SIZE %1").arg(path), path,
        [path, handler](const std::optional<FtpError> &failure, const FtpReply &reply) {
            if (failure) {
                handler(failure, -1);
                return;
            }
            bool ok = false;
            const qint64 value = reply.message.trimmed().toLongLong(&ok);
            if (!ok) {
                handler(FtpError::make(FtpErrorKind::MalformedReply,
                                       QString("Failed to parse SIZE response: %1").arg(reply.message),
                                       reply.code).withPath(path),
                        -1);
                return;
            }
            handler(std::nullopt, value);
        });
}

void FtpSession::modifiedTime(const QString &path, TimeHandler handler)
{
    config_.log(QString("Getting modification time of %1").arg(path));
    runCommand(QString("MDTM %1").arg(path), path,
        [path, handler](const std::optional<FtpError> &failure, const FtpReply &reply) {
            if (failure) {
                handler(failure, QDateTime());
                return;
            }
            const QDateTime time = FtpListingParser::parseModificationTime(reply.message);
            if (!time.isValid()) {
                handler(FtpError::make(FtpErrorKind::MalformedReply,
                                       QString("Failed to parse MDTM response: %1").arg(reply.message),
                                       reply.code).withPath(path),
                        QDateTime());
                return;
            }
            handler(std::nullopt, time);
        });
}

void FtpSession::chmod(const QString &mode, const QString &path, DoneHandler handler)
{
    runSimpleCommand(QString("SITE CHMOD %1 %2").arg(mode, path), path, std::move(handler));
}

void FtpSession::site(const QString &arguments, ReplyHandler handler)
{
    runCommand(QString("SITE %1").arg(arguments), QString(), std::move(handler));
}

void FtpSession::setTransferType(TransferType type, DoneHandler handler)
{
    runSimpleCommand(type == TransferType::Binary ? QStringLiteral("TYPE I") : QStringLiteral("TYPE A"),
                     QString(), std::move(handler));
}

// Transfers

void FtpSession::runTransfer(FtpTransfer::Kind kind, const QString &remotePath,
                             QIODevice *source, QIODevice *sink, TransferHandler handler)
{
    if (const auto notReady = checkReady(remotePath)) {
        reportError(*notReady);
        FtpTransferResult result;
        result.error = notReady;
        handler(result);
        return;
    }

    auto *transfer = new FtpTransfer(channel_, negotiator_.get(), kind, remotePath, this);
    transfer->setSource(source);
    transfer->setSink(sink);
    activeTransfer_ = transfer;
    setState(State::Busy);

    connect(transfer, &FtpTransfer::progress, this,
            [this, kind, remotePath](qint64 bytes, qint64 total) {
                if (kind == FtpTransfer::Kind::Store) {
                    emit uploadProgress(remotePath, bytes, total);
                } else if (kind == FtpTransfer::Kind::Retrieve) {
                    emit downloadProgress(remotePath, bytes, total);
                }
            });

    connect(transfer, &FtpTransfer::finished, this,
            [this, transfer, kind, handler](const FtpTransferResult &result) {
                if (activeTransfer_ == transfer) {
                    activeTransfer_ = nullptr;
                }
                if (state_ == State::Busy) {
                    setState(State::Ready);
                }

                if (result.ok()) {
                    ++transfersCompleted_;
                    if (kind == FtpTransfer::Kind::Store) {
                        bytesUploaded_ += result.bytesTransferred;
                    } else {
                        bytesDownloaded_ += result.bytesTransferred;
                    }
                    if (!result.confirmed) {
                        config_.log(QString("%1 finished without completion reply")
                                        .arg(FtpTransfer::commandFor(kind, transfer->remotePath())));
                    }
                } else {
                    reportError(*result.error);
                }

                transfer->deleteLater();
                handler(result);
            });

    transfer->start();
}

void FtpSession::list(const QString &path, TextHandler handler)
{
    config_.log(QString("Listing directory: %1").arg(path.isEmpty() ? QStringLiteral(".") : path));
    runTransfer(FtpTransfer::Kind::List, path, nullptr, nullptr,
        [handler](const FtpTransferResult &result) {
            if (!result.ok()) {
                handler(result.error, QString());
                return;
            }
            handler(std::nullopt, QString::fromUtf8(result.data));
        });
}

void FtpSession::listDetailed(const QString &path, ListingHandler handler)
{
    runTransfer(FtpTransfer::Kind::List, path, nullptr, nullptr,
        [handler](const FtpTransferResult &result) {
            if (!result.ok()) {
                handler(result.error, RemoteListing());
                return;
            }
            handler(std::nullopt, FtpListingParser::parse(result.data));
        });
}

void FtpSession::upload(const QByteArray &data, const QString &remotePath, DoneHandler handler)
{
    config_.log(QString("Uploading %1 bytes to %2").arg(data.size()).arg(remotePath));

    auto *buffer = new QBuffer(this);
    buffer->setData(data);
    buffer->open(QIODevice::ReadOnly);

    runTransfer(FtpTransfer::Kind::Store, remotePath, buffer, nullptr,
        [buffer, handler](const FtpTransferResult &result) {
            buffer->deleteLater();
            if (handler) {
                handler(result.error);
            }
        });
}

void FtpSession::upload(QIODevice *source, const QString &remotePath, DoneHandler handler)
{
    runTransfer(FtpTransfer::Kind::Store, remotePath, source, nullptr,
        [handler](const FtpTransferResult &result) {
            if (handler) {
                handler(result.error);
            }
        });
}

void FtpSession::uploadFile(const QString &localPath, const QString &remotePath, bool ensureDir,
                            DoneHandler handler)
{
    auto opened = std::make_unique<QFile>(localPath);
    if (!opened->open(QIODevice::ReadOnly)) {
        const FtpError failure = FtpError::make(
            FtpErrorKind::LocalIoError,
            QString("Cannot open local file '%1': %2").arg(localPath, opened->errorString()));
        reportError(failure);
        if (handler) {
            handler(failure);
        }
        return;
    }
    QFile *file = opened.release();
    file->setParent(this);

    auto startUpload = [this, file, remotePath, handler]() {
        upload(file, remotePath, [file, handler](const std::optional<FtpError> &failure) {
            file->close();
            file->deleteLater();
            if (handler) {
                handler(failure);
            }
        });
    };

    if (!ensureDir) {
        startUpload();
        return;
    }

    auto *directories = new FtpDirectoryOperator(this, this);
    directories->ensureParentExists(remotePath,
        [directories, file, handler, startUpload](const std::optional<FtpError> &failure) {
            directories->deleteLater();
            if (failure) {
                file->deleteLater();
                if (handler) {
                    handler(failure);
                }
                return;
            }
            startUpload();
        });
}

void FtpSession::download(const QString &remotePath, DataHandler handler)
{
    config_.log(QString("Downloading %1").arg(remotePath));
    runTransfer(FtpTransfer::Kind::Retrieve, remotePath, nullptr, nullptr,
        [handler](const FtpTransferResult &result) {
            handler(result.error, result.ok() ? result.data : QByteArray());
        });
}

void FtpSession::downloadStream(const QString &remotePath, QIODevice *sink, SizeHandler handler)
{
    config_.log(QString("Streaming download: %1").arg(remotePath));
    if (!sink) {
        const FtpError failure = FtpError::make(FtpErrorKind::LocalIoError,
                                                QStringLiteral("No download sink")).withPath(remotePath);
        reportError(failure);
        handler(failure, 0);
        return;
    }
    runTransfer(FtpTransfer::Kind::Retrieve, remotePath, nullptr, sink,
        [handler](const FtpTransferResult &result) {
            handler(result.error, result.bytesTransferred);
        });
}

void FtpSession::downloadFile(const QString &remotePath, const QString &localPath, DoneHandler handler)
{
    auto opened = std::make_unique<QFile>(localPath);
    if (!opened->open(QIODevice::WriteOnly)) {
        const FtpError failure = FtpError::make(
            FtpErrorKind::LocalIoError,
            QString("Cannot save file '%1': %2").arg(localPath, opened->errorString()));
        reportError(failure);
        if (handler) {
            handler(failure);
        }
        return;
    }
    QFile *file = opened.release();
    file->setParent(this);

    downloadStream(remotePath, file,
        [file, handler](const std::optional<FtpError> &failure, qint64) {
            file->close();
            if (failure) {
                file->remove();
            }
            file->deleteLater();
            if (handler) {
                handler(failure);
            }
        });
}

// Inspection

void FtpSession::stat(const QString &path, StatHandler handler)
{
    if (const auto notReady = checkReady(path)) {
        handler(notReady, FtpStatInfo());
        return;
    }

    // Probing failures are expected; keep them off the error() signal
    channel_->sendCommand(QString("SIZE %1").arg(path), false,
        [this, path, handler](const std::optional<FtpError> &failure, const FtpReply &reply) {
            bool ok = false;
            const qint64 value = reply.message.trimmed().toLongLong(&ok);
            if (!failure && ok) {
                FtpStatInfo info;
                info.exists = true;
                info.size = value;
                info.isFile = true;
                info.isDirectory = false;
                handler(std::nullopt, info);
                return;
            }
            statAsDirectory(path, handler);
        });
}

void FtpSession::statAsDirectory(const QString &path, StatHandler handler)
{
    if (!channel_) {
        handler(std::nullopt, FtpStatInfo());
        return;
    }

    channel_->sendCommand(QStringLiteral("PWD"), false,
        [this, path, handler](const std::optional<FtpError> &failure, const FtpReply &pwdReply) {
            if (failure || !channel_) {
                statFromParentListing(path, handler);
                return;
            }
            const QString original = parsePwdReply(pwdReply.message);

            channel_->sendCommand(QString("CWD %1").arg(path), false,
                [this, path, original, handler](const std::optional<FtpError> &cwdFailure, const FtpReply &) {
                    if (cwdFailure || !channel_) {
                        statFromParentListing(path, handler);
                        return;
                    }

                    // Restore original directory
                    channel_->sendCommand(QString("CWD %1").arg(original), false,
                        [this, original, handler](const std::optional<FtpError> &restoreFailure, const FtpReply &) {
                            if (restoreFailure) {
                                qWarning() << "FTP: could not return to" << original
                                           << "after probing:" << restoreFailure->toString();
                            }
                            FtpStatInfo info;
                            info.exists = true;
                            info.isFile = false;
                            info.isDirectory = true;
                            handler(std::nullopt, info);
                        });
                });
        });
}

void FtpSession::statFromParentListing(const QString &path, StatHandler handler)
{
    const QString parent = FtpListingParser::parentDirectory(path);
    const QString name = FtpListingParser::baseName(path);

    runTransfer(FtpTransfer::Kind::List, parent, nullptr, nullptr,
        [name, handler](const FtpTransferResult &result) {
            FtpStatInfo info;
            if (result.ok()) {
                const RemoteListing entries = FtpListingParser::parse(result.data);
                for (const FtpEntry &entry : entries) {
                    if (entry.name == name) {
                        info.exists = true;
                        break;
                    }
                }
            }
            handler(std::nullopt, info);
        });
}

void FtpSession::exists(const QString &path, BoolHandler handler)
{
    stat(path, [handler](const std::optional<FtpError> &failure, const FtpStatInfo &info) {
        handler(failure, info.exists);
    });
}

FtpSessionStats FtpSession::stats() const
{
    FtpSessionStats result;
    result.connected = isConnected();
    result.authenticated = isLoggedIn();
    if (channel_) {
        result.commandCount = channel_->commandCount();
        result.lastCommand = channel_->lastCommand();
    }
    result.transfersCompleted = transfersCompleted_;
    result.bytesUploaded = bytesUploaded_;
    result.bytesDownloaded = bytesDownloaded_;
    return result;
}
