#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <memory>

#include "app/cli/commands.hpp"

class QSettings;
class QSocketNotifier;
class QTextStream;

namespace lanlink::app {

class Node;

/**
 * Console - line-oriented front end over stdin/stdout.
 *
 * Every node event is written as one JSON object per line:
 * {"event": "<name>", ...payload}. Command failures are reported the same
 * way under "command-error".
 */
class Console : public QObject {
    Q_OBJECT

public:
    Console(Node& node, QSettings& settings, QObject* parent = nullptr);
    ~Console() override;

    /**
     * Start reading commands from stdin.
     */
    void start();

    /**
     * Run one parsed command against the node.
     */
    Result<void, Error> execute(const Command& command);

signals:
    void quitRequested();

private:
    void onStdinReadable();
    void handleLine(const QString& line);
    void writeEvent(const QString& name, const QJsonObject& payload);

    Node& node_;
    QSettings& settings_;
    std::unique_ptr<QSocketNotifier> notifier_;
    std::unique_ptr<QTextStream> out_;
    QByteArray pending_;
};

} // namespace lanlink::app
