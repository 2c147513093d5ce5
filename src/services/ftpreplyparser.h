/**
 * @file ftpreplyparser.h
 * @brief Line framing and reply classification for the FTP control channel.
 */

#ifndef FTPREPLYPARSER_H
#define FTPREPLYPARSER_H

#include <QByteArray>
#include <QStringList>

#include "ftpreply.h"

/**
 * @brief Splits control-channel bytes into reply lines and classifies them.
 *
 * Framing keeps a carry-over buffer, so a CRLF terminator (or a UTF-8
 * sequence) split across two reads is reassembled before the line is
 * emitted. Classification tracks open multi-line replies: once "NNN-" has
 * been seen, every line up to and including "NNN " belongs to that reply and
 * only the closing line is terminal.
 *
 * @par Example usage:
 * @code
 * FtpReplyParser parser;
 * for (const QString &line : parser.feed(socket->readAll())) {
 *     FtpReplyLine reply;
 *     if (parser.accept(line, &reply) == FtpReplyParser::Result::Terminal) {
 *         handle(reply);
 *     }
 * }
 * @endcode
 */
class FtpReplyParser
{
public:
    /// @name FTP Protocol Constants
    /// @{
    static constexpr int ReplyCodeLength = 3;  ///< Length of FTP reply code
    static constexpr int ReplyTextOffset = 4;  ///< Offset to reply text after code
    static constexpr int CrLfLength = 2;  ///< Length of CRLF line ending
    /// @}

    /**
     * @brief Outcome of feeding one line to accept().
     */
    enum class Result {
        Terminal,      ///< Line concludes a reply; its code is authoritative
        Continuation,  ///< Line belongs to a still-open multi-line reply
        Malformed      ///< Line is not a valid reply line
    };

    /**
     * @brief Appends a chunk and returns every line it completes.
     * @param chunk Raw bytes as read from the socket.
     * @return Complete lines without their CRLF, empty lines skipped.
     */
    [[nodiscard]] QStringList feed(const QByteArray &chunk);

    /**
     * @brief Classifies a line in the context of any open multi-line reply.
     * @param line One complete line from feed().
     * @param out Receives the parsed line (left untouched on Malformed).
     */
    Result accept(const QString &line, FtpReplyLine *out);

    /**
     * @brief Parses a single line without multi-line context.
     * @param line The line to classify.
     * @param out Receives code, terminal marker and message.
     * @return False if the line is not "NNN", "NNN text" or "NNN-text".
     */
    [[nodiscard]] static bool classify(const QString &line, FtpReplyLine *out);

    /**
     * @brief Drops the partial line and any open multi-line reply.
     */
    void reset();

    [[nodiscard]] bool inMultiLineReply() const { return multiLineCode_ != 0; }
    [[nodiscard]] int pendingByteCount() const { return buffer_.size(); }

private:
    QByteArray buffer_;
    int multiLineCode_ = 0;
};

#endif // FTPREPLYPARSER_H
