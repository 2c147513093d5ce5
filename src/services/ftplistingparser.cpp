#include "ftplistingparser.h"

#include <QRegularExpression>
#include <QStringList>
#include <QTimeZone>

namespace {

const QStringList MonthNames = {
    QStringLiteral("jan"), QStringLiteral("feb"), QStringLiteral("mar"),
    QStringLiteral("apr"), QStringLiteral("may"), QStringLiteral("jun"),
    QStringLiteral("jul"), QStringLiteral("aug"), QStringLiteral("sep"),
    QStringLiteral("oct"), QStringLiteral("nov"), QStringLiteral("dec")
};

} // namespace

RemoteListing FtpListingParser::parse(const QByteArray &data)
{
    RemoteListing entries;
    const QStringList lines = QString::fromUtf8(data).split('\n', Qt::SkipEmptyParts);

    for (QString line : lines) {
        if (line.endsWith('\r')) {
            line.chop(1);
        }

        FtpEntry entry;
        if (!parseLine(line, entry)) {
            continue;
        }
        if (!entry.name.isEmpty() && entry.name != "." && entry.name != "..") {
            entries.append(entry);
        }
    }

    return entries;
}

bool FtpListingParser::parseLine(const QString &line, FtpEntry &entry)
{
    if (line.trimmed().isEmpty()) {
        return false;
    }

    static const QRegularExpression totalRx("^total\\s+\\d+\\s*$");
    if (totalRx.match(line).hasMatch()) {
        return false;
    }

    if (parseUnixLine(line, entry) || parseDosLine(line, entry)) {
        return true;
    }

    // Simple listing - just filename
    entry = FtpEntry();
    entry.name = line.trimmed();
    entry.kind = FtpEntry::Kind::Unknown;
    return true;
}

bool FtpListingParser::parseUnixLine(const QString &line, FtpEntry &entry)
{
    // drwxr-xr-x 2 user group 4096 Jan  1 12:00 dirname
    // Some servers leave out the group column
    static const QRegularExpression unixRx(
        "^([dlcbps\\-])([rwxsStT\\-]{9})[+@.]?\\s+\\d+\\s+(\\S+)\\s+(?:(\\S+)\\s+)?(\\d+)\\s+"
        "(\\w{3}\\s+\\d{1,2}\\s+(?:\\d{1,2}:\\d{2}|\\d{4}))\\s(.+)$");

    const QRegularExpressionMatch match = unixRx.match(line);
    if (!match.hasMatch()) {
        return false;
    }

    const QChar type = match.captured(1).at(0);
    if (type == 'd') {
        entry.kind = FtpEntry::Kind::Directory;
    } else if (type == '-') {
        entry.kind = FtpEntry::Kind::File;
    } else if (type == 'l') {
        entry.kind = FtpEntry::Kind::Symlink;
    } else {
        entry.kind = FtpEntry::Kind::Unknown;
    }

    entry.permissions = match.captured(2);
    entry.owner = match.captured(3);
    entry.group = match.captured(4);
    entry.size = match.captured(5).toLongLong();
    entry.timestampText = match.captured(6).simplified();
    entry.modified = parseUnixTimestamp(entry.timestampText);

    QString name = match.captured(7).trimmed();

    if (entry.kind == FtpEntry::Kind::Symlink) {
        const int arrow = name.indexOf(QLatin1String(" -> "));
        if (arrow >= 0) {
            entry.linkTarget = name.mid(arrow + 4);
            name = name.left(arrow);
        }
    }
    if (entry.kind == FtpEntry::Kind::Directory) {
        entry.size = 0;
    }

    entry.name = name;
    return true;
}

bool FtpListingParser::parseDosLine(const QString &line, FtpEntry &entry)
{
    // 01-15-24  10:30AM       <DIR>          folder
    // 01-15-24  10:30AM                 1234 file.txt
    static const QRegularExpression dosRx(
        "^(\\d{2})-(\\d{2})-(\\d{2}|\\d{4})\\s+(\\d{1,2}):(\\d{2})([AaPp][Mm])?\\s+(<DIR>|\\d+)\\s+(.+)$");

    const QRegularExpressionMatch match = dosRx.match(line);
    if (!match.hasMatch()) {
        return false;
    }

    int year = match.captured(3).toInt();
    if (match.captured(3).length() == 2) {
        year += (year < 70) ? 2000 : 1900;
    }
    int hour = match.captured(4).toInt();
    const QString meridiem = match.captured(6).toUpper();
    if (meridiem == "PM" && hour < 12) {
        hour += 12;
    } else if (meridiem == "AM" && hour == 12) {
        hour = 0;
    }

    const QDate date(year, match.captured(1).toInt(), match.captured(2).toInt());
    const QTime time(hour, match.captured(5).toInt());
    if (date.isValid() && time.isValid()) {
        entry.modified = QDateTime(date, time, QTimeZone::utc());
    }
    entry.timestampText = QString("%1-%2-%3 %4:%5%6")
                              .arg(match.captured(1), match.captured(2), match.captured(3),
                                   match.captured(4), match.captured(5), match.captured(6));

    if (match.captured(7) == QLatin1String("<DIR>")) {
        entry.kind = FtpEntry::Kind::Directory;
        entry.size = 0;
    } else {
        entry.kind = FtpEntry::Kind::File;
        entry.size = match.captured(7).toLongLong();
    }
    entry.name = match.captured(8).trimmed();
    return true;
}

QDateTime FtpListingParser::parseUnixTimestamp(const QString &text)
{
    const QStringList parts = text.split(' ', Qt::SkipEmptyParts);
    if (parts.size() != 3) {
        return QDateTime();
    }

    const int month = MonthNames.indexOf(parts.at(0).toLower()) + 1;
    const int day = parts.at(1).toInt();
    if (month <= 0 || day <= 0) {
        return QDateTime();
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    if (parts.at(2).contains(':')) {
        // "Jan  1 12:00" is within the last six months: this year, or last
        // year if that date would lie in the future
        const QTime time = QTime::fromString(parts.at(2), "H:mm");
        QDateTime result(QDate(now.date().year(), month, day), time, QTimeZone::utc());
        if (result.isValid() && result > now.addDays(1)) {
            result = QDateTime(QDate(now.date().year() - 1, month, day), time, QTimeZone::utc());
        }
        return result;
    }

    return QDateTime(QDate(parts.at(2).toInt(), month, day), QTime(0, 0), QTimeZone::utc());
}

QDateTime FtpListingParser::parseModificationTime(const QString &message)
{
    static const QRegularExpression rx("(\\d{14})");
    const QRegularExpressionMatch match = rx.match(message);
    if (!match.hasMatch()) {
        return QDateTime();
    }

    const QString stamp = match.captured(1);
    const QDate date(stamp.mid(0, 4).toInt(), stamp.mid(4, 2).toInt(), stamp.mid(6, 2).toInt());
    const QTime time(stamp.mid(8, 2).toInt(), stamp.mid(10, 2).toInt(), stamp.mid(12, 2).toInt());
    if (!date.isValid() || !time.isValid()) {
        return QDateTime();
    }
    return QDateTime(date, time, QTimeZone::utc());
}

QString FtpListingParser::normalizePath(const QString &path)
{
    static const QRegularExpression slashesRx("/+");
    QString normalized = path;
    normalized.replace('\\', '/');
    normalized.replace(slashesRx, QStringLiteral("/"));
    if (normalized.length() > 1 && normalized.endsWith('/')) {
        normalized.chop(1);
    }
    return normalized;
}

QString FtpListingParser::parentDirectory(const QString &path)
{
    const QString normalized = normalizePath(path);
    const int lastSlash = normalized.lastIndexOf('/');
    if (lastSlash <= 0) {
        return QStringLiteral("/");
    }
    return normalized.left(lastSlash);
}

QString FtpListingParser::baseName(const QString &path)
{
    const QString normalized = normalizePath(path);
    if (normalized == QLatin1String("/")) {
        return QString();
    }
    return normalized.mid(normalized.lastIndexOf('/') + 1);
}

QString FtpListingParser::joinPath(const QString &directory, const QString &name)
{
    if (directory.isEmpty()) {
        return name;
    }
    if (directory.endsWith('/')) {
        return directory + name;
    }
    return directory + '/' + name;
}
