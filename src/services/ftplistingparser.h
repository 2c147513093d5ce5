/**
 * @file ftplistingparser.h
 * @brief Parsing of LIST output, MDTM replies and remote path helpers.
 */

#ifndef FTPLISTINGPARSER_H
#define FTPLISTINGPARSER_H

#include <QByteArray>
#include <QDateTime>
#include <QString>

#include "ftpentry.h"

/**
 * @brief Stateless helpers for interpreting server-side text.
 *
 * LIST output is not standardized. Unix "ls -l" style lines are recognized
 * first, then the DOS/IIS style; anything else becomes a name-only entry of
 * kind Unknown so that no entry is silently lost.
 */
class FtpListingParser
{
public:
    /// @name MDTM Timestamp Layout
    /// @{
    static constexpr int TimestampLength = 14;  ///< YYYYMMDDhhmmss
    /// @}

    /**
     * @brief Parses a complete LIST payload.
     * @param data Raw listing bytes (UTF-8, CRLF or LF separated).
     * @return Entries in listing order, without "." and "..".
     */
    [[nodiscard]] static RemoteListing parse(const QByteArray &data);

    /**
     * @brief Parses a single listing line.
     * @param line One line without its terminator.
     * @param entry Receives the parsed entry.
     * @return False for blank lines and "total N" headers.
     */
    [[nodiscard]] static bool parseLine(const QString &line, FtpEntry &entry);

    /**
     * @brief Extracts the timestamp from an MDTM reply, e.g. "20240115103000".
     * @return UTC time, or an invalid QDateTime if no 14-digit stamp is present.
     */
    [[nodiscard]] static QDateTime parseModificationTime(const QString &message);

    /// @name Remote Path Helpers
    /// @{

    /**
     * @brief Converts backslashes to slashes and collapses repeated slashes.
     */
    [[nodiscard]] static QString normalizePath(const QString &path);

    /**
     * @brief Returns the parent of @p path; "/" for top-level and relative names.
     */
    [[nodiscard]] static QString parentDirectory(const QString &path);

    /**
     * @brief Returns the last path segment, ignoring a trailing slash.
     */
    [[nodiscard]] static QString baseName(const QString &path);

    /**
     * @brief Joins a directory and a name with exactly one slash.
     */
    [[nodiscard]] static QString joinPath(const QString &directory, const QString &name);
    /// @}

private:
    static bool parseUnixLine(const QString &line, FtpEntry &entry);
    static bool parseDosLine(const QString &line, FtpEntry &entry);
    static QDateTime parseUnixTimestamp(const QString &text);
};

#endif // FTPLISTINGPARSER_H
