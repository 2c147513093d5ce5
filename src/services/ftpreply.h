/**
 * @file ftpreply.h
 * @brief Reply, reply line and error value types shared by the FTP engine.
 */

#ifndef FTPREPLY_H
#define FTPREPLY_H

#include <QMetaType>
#include <QString>

#include <functional>
#include <optional>

/**
 * @brief A resolved command reply (terminal line of the server's response).
 */
struct FtpReply {
    /// @name FTP Response Codes (RFC 959)
    /// @{
    static constexpr int DataConnectionOpen = 125;  ///< Data connection already open
    static constexpr int FileStatusOk = 150;  ///< File status okay, opening connection
    static constexpr int CommandOk = 200;  ///< Command okay
    static constexpr int FileStatus = 213;  ///< File status (SIZE, MDTM)
    static constexpr int ServiceReady = 220;  ///< Service ready for new user
    static constexpr int ClosingControl = 221;  ///< Service closing control connection
    static constexpr int TransferComplete = 226;  ///< Transfer complete
    static constexpr int EnteringPassive = 227;  ///< Entering passive mode
    static constexpr int UserLoggedIn = 230;  ///< User logged in, proceed
    static constexpr int ActionOk = 250;  ///< Requested file action okay
    static constexpr int PathCreated = 257;  ///< Pathname created / current directory
    static constexpr int PasswordRequired = 331;  ///< User name okay, need password
    static constexpr int PendingFurtherInfo = 350;  ///< Requested action pending further info
    static constexpr int ServiceClosing = 421;  ///< Service not available, closing control connection
    static constexpr int FileUnavailable = 550;  ///< File unavailable (not found, no access)
    static constexpr int FileNameNotAllowed = 553;  ///< File name not allowed (often: exists)
    static constexpr int ErrorThreshold = 400;  ///< Codes >= this indicate error
    /// @}

    int code = 0;     ///< Three-digit status code
    QString message;  ///< Text after the code separator
};

/**
 * @brief One classified line read from the control channel.
 */
struct FtpReplyLine {
    int code = 0;             ///< Three-digit status code
    bool isTerminal = true;   ///< False for "NNN-" continuation lines
    QString message;          ///< Everything after the fourth character
    QString raw;              ///< The full line as received

    [[nodiscard]] bool isPreliminary() const { return code >= 100 && code < 200; }
    [[nodiscard]] bool isSuccess() const { return code >= 200 && code < FtpReply::ErrorThreshold; }
    [[nodiscard]] bool isFailure() const { return code >= FtpReply::ErrorThreshold; }
};

/**
 * @brief Categories of engine failures.
 */
enum class FtpErrorKind {
    MalformedReply,         ///< A reply line could not be classified
    ProtocolViolation,      ///< Single-flight invariant broken by the caller
    CommandTimeout,         ///< No terminal reply before the deadline
    ServerError,            ///< Server-reported failure (code >= 400)
    DataChannelError,       ///< I/O failure on the data connection
    MalformedPassiveReply,  ///< PASV reply without the six-number endpoint
    NotConnected,           ///< Operation requires a logged-in session
    ConnectionError,        ///< Control connection failed or dropped
    LocalIoError            ///< Local source or sink could not be used
};

/**
 * @brief Failure value carried through every engine callback.
 *
 * Server failures keep the original status code and message so that callers
 * can report them verbatim.
 */
struct FtpError {
    FtpErrorKind kind = FtpErrorKind::ServerError;
    int code = 0;      ///< Server status code, 0 when not server-reported
    QString message;   ///< Server text or a description of the failure
    QString path;      ///< Remote path the operation was working on, if any

    /**
     * @brief Renders the error for display and logging.
     * @return e.g. "FTP Error 550: No such file (path: /x)".
     */
    [[nodiscard]] QString toString() const;

    /**
     * @brief Returns a copy carrying the given path context.
     */
    [[nodiscard]] FtpError withPath(const QString &remotePath) const;

    [[nodiscard]] static FtpError make(FtpErrorKind kind, const QString &message, int code = 0);
    [[nodiscard]] static FtpError fromReply(const FtpReplyLine &line);
};

/**
 * @brief Converts an error kind to its name for logging.
 */
[[nodiscard]] QString errorKindToString(FtpErrorKind kind);

/// Completion callback of a single command. Called exactly once.
using ReplyHandler = std::function<void(const std::optional<FtpError> &error, const FtpReply &reply)>;

/// Completion callback of operations without a payload.
using DoneHandler = std::function<void(const std::optional<FtpError> &error)>;

Q_DECLARE_METATYPE(FtpReply)
Q_DECLARE_METATYPE(FtpError)

#endif // FTPREPLY_H
