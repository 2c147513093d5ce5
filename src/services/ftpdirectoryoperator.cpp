#include "ftpdirectoryoperator.h"

#include <QDebug>

#include "ftplistingparser.h"
#include "iftpclient.h"
#include "utils/logging.h"

FtpDirectoryOperator::FtpDirectoryOperator(IFtpClient *client, QObject *parent)
    : QObject(parent)
    , client_(client)
{
}

void FtpDirectoryOperator::ensureExists(const QString &path, DoneHandler handler)
{
    const QString normalized = FtpListingParser::normalizePath(path);
    if (normalized.isEmpty() || normalized == "/" || normalized == ".") {
        // Root or current directory always exists
        handler(std::nullopt);
        return;
    }

    LOG_VERBOSE() << "FTP: Ensuring directory exists:" << normalized;

    client_->changeDirectory(normalized,
        [this, normalized, handler](const std::optional<FtpError> &error) {
            if (!error) {
                LOG_VERBOSE() << "FTP: Directory already exists:" << normalized;
                handler(std::nullopt);
                return;
            }

            const QString parent = FtpListingParser::parentDirectory(normalized);
            if (parent == "/" || parent == ".") {
                createDirectory(normalized, handler);
                return;
            }

            ensureExists(parent, [this, normalized, handler](const std::optional<FtpError> &parentError) {
                if (parentError) {
                    handler(parentError);
                    return;
                }
                createDirectory(normalized, handler);
            });
        });
}

void FtpDirectoryOperator::createDirectory(const QString &path, DoneHandler handler)
{
    client_->makeDirectory(path, [this, path, handler](const std::optional<FtpError> &error) {
        if (!error) {
            qDebug() << "FTP: Created directory:" << path;
            emit directoryCreated(path);
            handler(std::nullopt);
            return;
        }
        if (isAlreadyExistsError(*error)) {
            // Created by someone else in the meantime
            LOG_VERBOSE() << "FTP: Directory appeared concurrently:" << path;
            handler(std::nullopt);
            return;
        }
        handler(error);
    });
}

void FtpDirectoryOperator::ensureParentExists(const QString &filePath, DoneHandler handler)
{
    ensureExists(FtpListingParser::parentDirectory(filePath), std::move(handler));
}

void FtpDirectoryOperator::removeDirectory(const QString &path, bool recursive, DoneHandler handler)
{
    if (recursive) {
        removeSubtree(path, std::move(handler));
        return;
    }
    const QString normalized = FtpListingParser::normalizePath(path);
    client_->removeDirectory(normalized, [this, normalized, handler](const std::optional<FtpError> &error) {
        if (!error) {
            emit entryRemoved(normalized);
        }
        handler(error);
    });
}

void FtpDirectoryOperator::removeSubtree(const QString &path, DoneHandler handler)
{
    const QString normalized = FtpListingParser::normalizePath(path);

    client_->listDetailed(normalized,
        [this, normalized, handler](const std::optional<FtpError> &error, const RemoteListing &entries) {
            if (error) {
                handler(error);
                return;
            }

            // Files first, then subdirectories, each group in listing order
            RemoteListing ordered;
            for (const FtpEntry &entry : entries) {
                if (!entry.isDirectory()) {
                    ordered.append(entry);
                }
            }
            for (const FtpEntry &entry : entries) {
                if (entry.isDirectory()) {
                    ordered.append(entry);
                }
            }

            auto shared = std::make_shared<const RemoteListing>(ordered);
            removeEntries(normalized, shared, 0,
                [this, normalized, handler](const std::optional<FtpError> &entriesError) {
                    if (entriesError) {
                        handler(entriesError);
                        return;
                    }
                    client_->removeDirectory(normalized,
                        [this, normalized, handler](const std::optional<FtpError> &rmdError) {
                            if (!rmdError) {
                                emit entryRemoved(normalized);
                            }
                            handler(rmdError);
                        });
                });
        });
}

void FtpDirectoryOperator::removeEntries(const QString &directory,
                                         std::shared_ptr<const RemoteListing> entries,
                                         int index, DoneHandler handler)
{
    if (index >= entries->size()) {
        handler(std::nullopt);
        return;
    }

    const FtpEntry &entry = entries->at(index);
    const QString fullPath = FtpListingParser::joinPath(directory, entry.name);

    if (entry.isDirectory()) {
        removeSubtree(fullPath, [this, directory, entries, index, handler](const std::optional<FtpError> &error) {
            if (error) {
                handler(error);
                return;
            }
            removeEntries(directory, entries, index + 1, handler);
        });
        return;
    }

    client_->remove(fullPath, [this, directory, entries, index, fullPath, handler](const std::optional<FtpError> &error) {
        if (error) {
            ++failedRemovals_;
            qWarning() << "FTP: failed to delete" << fullPath << "-" << error->toString();
            emit entryRemoveFailed(fullPath, error->toString());
        } else {
            emit entryRemoved(fullPath);
        }
        removeEntries(directory, entries, index + 1, handler);
    });
}

bool FtpDirectoryOperator::isAlreadyExistsError(const FtpError &error)
{
    return error.code == FtpReply::FileUnavailable
           || error.code == FtpReply::FileNameNotAllowed
           || error.message.contains(QLatin1String("exists"), Qt::CaseInsensitive);
}
