#include "ftpreply.h"

QString FtpError::toString() const
{
    QString text;
    if (kind == FtpErrorKind::ServerError) {
        text = QString("FTP Error %1: %2").arg(code).arg(message);
    } else if (code > 0) {
        text = QString("%1 (%2): %3").arg(errorKindToString(kind)).arg(code).arg(message);
    } else {
        text = QString("%1: %2").arg(errorKindToString(kind), message);
    }

    if (!path.isEmpty()) {
        text += QString(" (path: %1)").arg(path);
    }
    return text;
}

FtpError FtpError::withPath(const QString &remotePath) const
{
    FtpError copy = *this;
    copy.path = remotePath;
    return copy;
}

FtpError FtpError::make(FtpErrorKind kind, const QString &message, int code)
{
    FtpError error;
    error.kind = kind;
    error.code = code;
    error.message = message;
    return error;
}

FtpError FtpError::fromReply(const FtpReplyLine &line)
{
    return make(FtpErrorKind::ServerError, line.message, line.code);
}

QString errorKindToString(FtpErrorKind kind)
{
    switch (kind) {
    case FtpErrorKind::MalformedReply:
        return QStringLiteral("MalformedReply");
    case FtpErrorKind::ProtocolViolation:
        return QStringLiteral("ProtocolViolation");
    case FtpErrorKind::CommandTimeout:
        return QStringLiteral("CommandTimeout");
    case FtpErrorKind::ServerError:
        return QStringLiteral("ServerError");
    case FtpErrorKind::DataChannelError:
        return QStringLiteral("DataChannelError");
    case FtpErrorKind::MalformedPassiveReply:
        return QStringLiteral("MalformedPassiveReply");
    case FtpErrorKind::NotConnected:
        return QStringLiteral("NotConnected");
    case FtpErrorKind::ConnectionError:
        return QStringLiteral("ConnectionError");
    case FtpErrorKind::LocalIoError:
        return QStringLiteral("LocalIoError");
    }
    return QStringLiteral("Unknown");
}
