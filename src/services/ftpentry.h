#ifndef FTPENTRY_H
#define FTPENTRY_H

#include <QDateTime>
#include <QList>
#include <QString>

/**
 * @brief Represents a single entry in an FTP directory listing.
 */
struct FtpEntry {
    /**
     * @brief Entry type as far as the listing reveals it.
     */
    enum class Kind {
        File,       ///< Regular file ("-")
        Directory,  ///< Directory ("d", or "<DIR>" in DOS listings)
        Symlink,    ///< Symbolic link ("l")
        Unknown     ///< Name-only line or unrecognized type letter
    };

    QString name;              ///< Name of the file or directory
    Kind kind = Kind::Unknown; ///< Entry type
    qint64 size = 0;           ///< Size in bytes (0 for directories)
    QString permissions;       ///< Unix-style permission string
    QString owner;
    QString group;
    QString timestampText;     ///< Date as listed, e.g. "Jan  1 12:00"
    QDateTime modified;        ///< Parsed timestamp when the format allows it
    QString linkTarget;        ///< Target of a symbolic link

    [[nodiscard]] bool isDirectory() const { return kind == Kind::Directory; }
    [[nodiscard]] bool isFile() const { return kind == Kind::File; }
};

using RemoteListing = QList<FtpEntry>;

#endif // FTPENTRY_H
