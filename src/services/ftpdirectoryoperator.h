/**
 * @file ftpdirectoryoperator.h
 * @brief Recursive directory creation and removal on top of IFtpClient.
 */

#ifndef FTPDIRECTORYOPERATOR_H
#define FTPDIRECTORYOPERATOR_H

#include <QObject>
#include <QString>

#include <memory>

#include "ftpentry.h"
#include "ftpreply.h"

class IFtpClient;

/**
 * @brief Idempotent "ensure path exists" and "delete subtree".
 *
 * Both operations work one path segment or one directory entry at a time and
 * only ever have one request outstanding on the client. Nothing is rolled
 * back: a subtree removal that fails partway leaves the remaining entries in
 * place.
 *
 * The operator must outlive the operations it starts.
 *
 * @par Example usage:
 * @code
 * auto *directories = new FtpDirectoryOperator(session, this);
 * directories->ensureExists("/backup/2024/01", [](const std::optional<FtpError> &error) {
 *     if (error) {
 *         qWarning() << error->toString();
 *     }
 * });
 * @endcode
 */
class FtpDirectoryOperator : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an operator.
     * @param client Logged-in client (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit FtpDirectoryOperator(IFtpClient *client, QObject *parent = nullptr);

    /**
     * @brief Creates @p path and any missing ancestors.
     *
     * Tries to change into the full path first; on failure ensures the parent
     * and then creates the leaf. A creation failure meaning "already exists"
     * (550, 553 or "exists" in the text) counts as success, since another
     * client may have created it in the meantime. "/", "." and "" succeed
     * without any request.
     *
     * Leaves the client's working directory wherever the last successful
     * CWD put it.
     */
    void ensureExists(const QString &path, DoneHandler handler);

    /**
     * @brief Ensures the directory that will contain @p filePath exists.
     */
    void ensureParentExists(const QString &filePath, DoneHandler handler);

    /**
     * @brief Deletes @p path with everything below it.
     *
     * Lists the directory, deletes every entry that is not a directory,
     * recurses into the subdirectories and finally removes the directory
     * itself. A single entry that cannot be deleted is reported through
     * entryRemoveFailed() and skipped; the final RMD then usually fails and
     * that error is returned.
     */
    void removeSubtree(const QString &path, DoneHandler handler);

    /**
     * @brief Removes a directory, recursively or with a single RMD.
     */
    void removeDirectory(const QString &path, bool recursive, DoneHandler handler);

    /**
     * @brief Number of entries whose deletion failed since construction.
     */
    [[nodiscard]] int failedRemovals() const { return failedRemovals_; }

    /**
     * @brief True if a MKD failure means the directory is already there.
     */
    [[nodiscard]] static bool isAlreadyExistsError(const FtpError &error);

signals:
    void directoryCreated(const QString &path);
    void entryRemoved(const QString &path);
    void entryRemoveFailed(const QString &path, const QString &message);

private:
    void createDirectory(const QString &path, DoneHandler handler);
    void removeEntries(const QString &directory, std::shared_ptr<const RemoteListing> entries,
                       int index, DoneHandler handler);

    IFtpClient *client_ = nullptr;
    int failedRemovals_ = 0;
};

#endif // FTPDIRECTORYOPERATOR_H
