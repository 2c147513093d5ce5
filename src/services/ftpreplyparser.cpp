#include "ftpreplyparser.h"

namespace {

constexpr int MinReplyCode = 100;
constexpr int MaxReplyCode = 599;

bool isAsciiDigit(QChar c)
{
    return c >= QLatin1Char('0') && c <= QLatin1Char('9');
}

} // namespace

QStringList FtpReplyParser::feed(const QByteArray &chunk)
{
    buffer_.append(chunk);

    QStringList lines;
    int idx = buffer_.indexOf("\r\n");
    while (idx >= 0) {
        QByteArray line = buffer_.left(idx);
        buffer_.remove(0, idx + CrLfLength);
        if (!line.isEmpty()) {
            lines.append(QString::fromUtf8(line));
        }
        idx = buffer_.indexOf("\r\n");
    }
    return lines;
}

FtpReplyParser::Result FtpReplyParser::accept(const QString &line, FtpReplyLine *out)
{
    if (multiLineCode_ != 0) {
        // Inside a multi-line reply only "NNN " with the opening code closes it
        FtpReplyLine parsed;
        if (classify(line, &parsed) && parsed.isTerminal && parsed.code == multiLineCode_) {
            multiLineCode_ = 0;
            *out = parsed;
            return Result::Terminal;
        }

        out->code = multiLineCode_;
        out->isTerminal = false;
        out->message = line;
        out->raw = line;
        return Result::Continuation;
    }

    FtpReplyLine parsed;
    if (!classify(line, &parsed)) {
        return Result::Malformed;
    }

    *out = parsed;
    if (!parsed.isTerminal) {
        multiLineCode_ = parsed.code;
        return Result::Continuation;
    }
    return Result::Terminal;
}

bool FtpReplyParser::classify(const QString &line, FtpReplyLine *out)
{
    if (line.length() < ReplyCodeLength) {
        return false;
    }
    for (int i = 0; i < ReplyCodeLength; ++i) {
        if (!isAsciiDigit(line[i])) {
            return false;
        }
    }

    const int code = line.left(ReplyCodeLength).toInt();
    if (code < MinReplyCode || code > MaxReplyCode) {
        return false;
    }

    bool terminal = true;
    if (line.length() > ReplyCodeLength) {
        const QChar separator = line[ReplyCodeLength];
        if (separator == QLatin1Char('-')) {
            terminal = false;
        } else if (separator != QLatin1Char(' ')) {
            return false;
        }
    }

    out->code = code;
    out->isTerminal = terminal;
    out->message = line.mid(ReplyTextOffset);
    out->raw = line;
    return true;
}

void FtpReplyParser::reset()
{
    buffer_.clear();
    multiLineCode_ = 0;
}
