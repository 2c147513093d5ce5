#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QFile>
#include <QTextStream>
#include <QTimer>

#include <csignal>

#include "services/ftpclientconfig.h"
#include "services/ftpdirectoryoperator.h"
#include "services/ftplistingparser.h"
#include "services/ftpsession.h"
#include "services/tcpftpsocket.h"
#include "utils/logging.h"
#include "version.h"

namespace {

volatile std::sig_atomic_t interrupted = 0;

void onInterrupt(int)
{
    interrupted = 1;
}

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString kindLabel(const FtpEntry &entry)
{
    switch (entry.kind) {
    case FtpEntry::Kind::Directory:
        return QStringLiteral("d");
    case FtpEntry::Kind::Symlink:
        return QStringLiteral("l");
    case FtpEntry::Kind::File:
        return QStringLiteral("-");
    case FtpEntry::Kind::Unknown:
        break;
    }
    return QStringLiteral("?");
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("ftpcore-cli");
    app.setApplicationVersion(FTPCORE_VERSION);

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Command-line FTP client\n\n"
        "Commands:\n"
        "  ls [path]              List a directory\n"
        "  get <remote> [local]   Download a file\n"
        "  put <local> <remote>   Upload a file\n"
        "  mkdirs <path>          Create a directory and its parents\n"
        "  rmtree <path>          Delete a directory recursively\n"
        "  stat <path>            Show whether a path exists and what it is\n"
        "  mdtm <path>            Show a file's modification time\n"
        "  quote <command...>     Send a raw command");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption hostOption(QStringList() << "H" << "host", "FTP server host", "host");
    QCommandLineOption portOption(QStringList() << "P" << "port", "FTP control port (default: 21)", "port", "21");
    QCommandLineOption userOption(QStringList() << "u" << "user", "Login name (default: anonymous)", "user");
    QCommandLineOption passwordOption(QStringList() << "p" << "password", "Login password", "password");
    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "JSON file with client settings", "file");
    QCommandLineOption timeoutOption("timeout", "Command timeout in milliseconds", "ms");
    QCommandLineOption connectTimeoutOption("connect-timeout", "Connect and login timeout in milliseconds", "ms");
    QCommandLineOption graceOption("grace",
                                   "Wait for the completion reply after a transfer, in milliseconds "
                                   "(0 waits up to the command timeout)", "ms");
    QCommandLineOption parentsOption("parents", "put: create missing remote directories");
    QCommandLineOption debugOption(QStringList() << "d" << "debug", "Print protocol traffic");
    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");

    parser.addOptions({hostOption, portOption, userOption, passwordOption, configOption,
                       timeoutOption, connectTimeoutOption, graceOption, parentsOption,
                       debugOption, verboseOption});
    parser.addPositionalArgument("command", "Command to run (see above)");
    parser.addPositionalArgument("args", "Command arguments", "[args...]");

    parser.process(app);

    // Set verbose logging flag
    ftpcore::verboseLogging = parser.isSet(verboseOption);

    if (ftpcore::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        err() << "No command given\n";
        parser.showHelp(1);
    }
    if (!parser.isSet(hostOption)) {
        err() << "Missing --host\n";
        return 1;
    }

    FtpClientConfig config;
    if (parser.isSet(configOption)) {
        QFile file(parser.value(configOption));
        if (!file.open(QIODevice::ReadOnly)) {
            err() << "Cannot read config file " << file.fileName() << ": " << file.errorString() << "\n";
            return 1;
        }
        QString parseError;
        const QJsonObject json = FtpClientConfig::parseConfigFile(file.readAll(), &parseError);
        if (!parseError.isEmpty()) {
            err() << file.fileName() << ": " << parseError << "\n";
            return 1;
        }
        config = FtpClientConfig::fromJson(json);
    }
    if (parser.isSet(timeoutOption)) {
        config.commandTimeoutMs = parser.value(timeoutOption).toInt();
    }
    if (parser.isSet(connectTimeoutOption)) {
        config.connectTimeoutMs = parser.value(connectTimeoutOption).toInt();
    }
    if (parser.isSet(graceOption)) {
        config.completionGraceMs = parser.value(graceOption).toInt();
    }
    if (parser.isSet(debugOption)) {
        config.debug = true;
        config.logger = [](const QString &line) { err() << line << "\n"; err().flush(); };
    }
    config.sanitize();

    bool portOk = false;
    const int port = parser.value(portOption).toInt(&portOk);
    if (!portOk || port <= 0 || port > 65535) {
        err() << "Invalid port: " << parser.value(portOption) << "\n";
        return 1;
    }

    auto *session = new FtpSession(config, TcpFtpSocket::factory(), &app);
    session->setHost(parser.value(hostOption), static_cast<quint16>(port));
    session->setCredentials(parser.value(userOption), parser.value(passwordOption));

    const QString command = args.first();
    const QStringList commandArgs = args.mid(1);
    int exitCode = 0;

    // Close the session, then leave the event loop with the command's status
    auto finish = [session, &exitCode](const std::optional<FtpError> &error) {
        if (error) {
            err() << error->toString() << "\n";
            exitCode = 1;
        }
        session->close([](const std::optional<FtpError> &) {
            QCoreApplication::exit(0);
        });
    };

    auto requireArgs = [&commandArgs, &command](int count) {
        if (commandArgs.size() < count) {
            err() << command << ": expected " << count << " argument(s)\n";
            return false;
        }
        return true;
    };

    std::function<void()> run;
    if (command == "ls") {
        const QString path = commandArgs.value(0);
        run = [session, path, finish]() {
            session->listDetailed(path, [finish](const std::optional<FtpError> &error, const RemoteListing &entries) {
                for (const FtpEntry &entry : entries) {
                    out() << kindLabel(entry) << entry.permissions.leftJustified(10)
                          << QString::number(entry.size).rightJustified(12) << "  "
                          << entry.timestampText.leftJustified(13) << " " << entry.name;
                    if (!entry.linkTarget.isEmpty()) {
                        out() << " -> " << entry.linkTarget;
                    }
                    out() << "\n";
                }
                out().flush();
                finish(error);
            });
        };
    } else if (command == "get") {
        if (!requireArgs(1)) {
            return 1;
        }
        const QString remote = commandArgs.at(0);
        const QString local = commandArgs.value(1, FtpListingParser::baseName(remote));
        run = [session, remote, local, finish]() {
            session->downloadFile(remote, local, finish);
        };
    } else if (command == "put") {
        if (!requireArgs(2)) {
            return 1;
        }
        const QString local = commandArgs.at(0);
        const QString remote = commandArgs.at(1);
        const bool parents = parser.isSet(parentsOption);
        run = [session, local, remote, parents, finish]() {
            session->uploadFile(local, remote, parents, finish);
        };
    } else if (command == "mkdirs") {
        if (!requireArgs(1)) {
            return 1;
        }
        const QString path = commandArgs.at(0);
        run = [session, path, finish]() {
            auto *directories = new FtpDirectoryOperator(session, session);
            directories->ensureExists(path, finish);
        };
    } else if (command == "rmtree") {
        if (!requireArgs(1)) {
            return 1;
        }
        const QString path = commandArgs.at(0);
        run = [session, path, finish]() {
            auto *directories = new FtpDirectoryOperator(session, session);
            QObject::connect(directories, &FtpDirectoryOperator::entryRemoved,
                             [](const QString &removed) { out() << "removed " << removed << "\n"; });
            directories->removeSubtree(path, finish);
        };
    } else if (command == "stat") {
        if (!requireArgs(1)) {
            return 1;
        }
        const QString path = commandArgs.at(0);
        run = [session, path, finish]() {
            session->stat(path, [path, finish](const std::optional<FtpError> &error, const FtpStatInfo &info) {
                if (!error) {
                    out() << path << ": ";
                    if (!info.exists) {
                        out() << "does not exist";
                    } else if (info.isDirectory.value_or(false)) {
                        out() << "directory";
                    } else if (info.isFile.value_or(false)) {
                        out() << "file, " << info.size.value_or(0) << " bytes";
                    } else {
                        out() << "exists";
                    }
                    out() << "\n";
                    out().flush();
                }
                finish(error);
            });
        };
    } else if (command == "mdtm") {
        if (!requireArgs(1)) {
            return 1;
        }
        const QString path = commandArgs.at(0);
        run = [session, path, finish]() {
            session->modifiedTime(path, [finish](const std::optional<FtpError> &error, const QDateTime &time) {
                if (!error) {
                    out() << time.toString(Qt::ISODate) << "\n";
                    out().flush();
                }
                finish(error);
            });
        };
    } else if (command == "quote") {
        if (!requireArgs(1)) {
            return 1;
        }
        const QString raw = commandArgs.join(' ');
        run = [session, raw, finish]() {
            session->sendCommand(raw, false, [finish](const std::optional<FtpError> &error, const FtpReply &reply) {
                if (!error) {
                    out() << reply.code << " " << reply.message << "\n";
                    out().flush();
                }
                finish(error);
            });
        };
    } else {
        err() << "Unknown command: " << command << "\n";
        return 1;
    }

    // Ctrl+C aborts the running transfer
    std::signal(SIGINT, onInterrupt);
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, [session, &exitCode]() {
        if (interrupted) {
            interrupted = 0;
            err() << "Interrupted\n";
            exitCode = 130;
            session->abort();
            QCoreApplication::exit(0);
        }
    });
    interruptPoll.start(200);

    session->connectToHost([run, &exitCode](const std::optional<FtpError> &error) {
        if (error) {
            err() << error->toString() << "\n";
            exitCode = 1;
            QCoreApplication::exit(0);
            return;
        }
        run();
    });

    app.exec();
    return exitCode;
}
