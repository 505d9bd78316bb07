#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

namespace lanlink::app {
namespace {

char level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

class LogSink {
public:
    static LogSink& instance() {
        static LogSink sink;
        return sink;
    }

    bool open(const QString& path, qint64 max_bytes) {
        QMutexLocker lock(&mu_);
        file_.close();
        max_bytes_ = max_bytes;
        if (path.isEmpty()) {
            return true;
        }
        if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
            return false;
        }
        rotate_log_file(path, max_bytes_);
        file_.setFileName(path);
        return file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
    }

    void write(const QByteArray& line) {
        QMutexLocker lock(&mu_);
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
        if (!file_.isOpen()) {
            return;
        }
        file_.write(line);
        file_.flush();
        if (max_bytes_ > 0 && file_.size() > max_bytes_) {
            const auto path = file_.fileName();
            file_.close();
            rotate_log_file(path, max_bytes_);
            file_.setFileName(path);
            if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                std::fprintf(stderr, "lanlink: log file %s lost after rotation\n", qPrintable(path));
            }
        }
    }

private:
    QMutex mu_;
    QFile file_;
    qint64 max_bytes_ = 0;
};

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs))
                          .arg(QLatin1Char(level_tag(type)))
                          .arg(QLatin1String(ctx.category ? ctx.category : "default"))
                          .arg(msg);
    LogSink::instance().write(line.toUtf8());
}

} // namespace

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return {};
    }
    return QDir(base).filePath(QStringLiteral("logs/lanlink.log"));
}

bool rotate_log_file(const QString& path, qint64 max_bytes) {
    const QFileInfo info(path);
    if (max_bytes <= 0 || !info.exists() || info.size() <= max_bytes) {
        return false;
    }
    const auto backup = path + QStringLiteral(".1");
    QFile::remove(backup);
    return QFile::rename(path, backup);
}

Result<void, Error> install_logging(const LogOptions& options) {
    if (options.debug) {
        QLoggingCategory::setFilterRules(QStringLiteral("lanlink.*.debug=true"));
    }
    const bool opened = LogSink::instance().open(options.path, options.max_bytes);
    qInstallMessageHandler(message_handler);
    if (!opened) {
        return Result<void, Error>::err(
            Error{ErrorKind::StorageWriteFailure, QStringLiteral("cannot open log file %1").arg(options.path)});
    }
    return Result<void, Error>::ok();
}

} // namespace lanlink::app
