#include <QCommandLineParser>
#include <QGuiApplication>
#include <QSettings>
#include <QTextStream>

#include "app/cli/commands.hpp"
#include "app/cli/console.hpp"
#include "app/logging.hpp"
#include "app/node.hpp"
#include "app/settings.hpp"
#include "core/log.hpp"
#include "core/sync_state.hpp"
#include "crypto/digest.hpp"
#include "platform/clipboard.hpp"
#include "storage/local_file_storage.hpp"

namespace {

bool apply_port(const QCommandLineParser& parser, const QCommandLineOption& option, quint16& port) {
    if (!parser.isSet(option)) {
        return true;
    }
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok || value <= 0 || value > 65535) {
        QTextStream(stderr) << "invalid port for --" << option.names().first() << ": "
                            << parser.value(option) << '\n';
        return false;
    }
    port = static_cast<quint16>(value);
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    // The clipboard needs a GUI application even when running headless (offscreen platform).
    QGuiApplication app(argc, argv);

    app.setApplicationName("lanlink");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("lanlink");
    app.setOrganizationDomain("lanlink.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("LAN peer: device discovery, file transfer, chat and clipboard sync.\n\n"
                       "Commands read from stdin:\n")
        + lanlink::app::usage_text());
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging (also sets LANLINK_DEBUG=1)."));
    parser.addOption(debugOption);

    const QCommandLineOption saveDirOption(
        QStringList{QStringLiteral("save-dir")},
        QStringLiteral("Directory for received files."),
        QStringLiteral("dir"));
    parser.addOption(saveDirOption);

    const QCommandLineOption hostnameOption(
        QStringList{QStringLiteral("hostname")},
        QStringLiteral("Name advertised to other devices."),
        QStringLiteral("name"));
    parser.addOption(hostnameOption);

    const QCommandLineOption ipOption(
        QStringList{QStringLiteral("ip")},
        QStringLiteral("LAN IPv4 address to advertise (detected when omitted)."),
        QStringLiteral("address"));
    parser.addOption(ipOption);

    const QCommandLineOption discoveryPortOption(
        QStringList{QStringLiteral("discovery-port")},
        QStringLiteral("UDP discovery port."),
        QStringLiteral("port"));
    parser.addOption(discoveryPortOption);

    const QCommandLineOption transferPortOption(
        QStringList{QStringLiteral("transfer-port")},
        QStringLiteral("File transfer port."),
        QStringLiteral("port"));
    parser.addOption(transferPortOption);

    const QCommandLineOption chatPortOption(
        QStringList{QStringLiteral("chat-port")},
        QStringLiteral("Chat port."),
        QStringLiteral("port"));
    parser.addOption(chatPortOption);

    const QCommandLineOption clipboardPortOption(
        QStringList{QStringLiteral("clipboard-port")},
        QStringLiteral("Clipboard sync port."),
        QStringLiteral("port"));
    parser.addOption(clipboardPortOption);

    parser.process(app);

    const bool debug = parser.isSet(debugOption) || qEnvironmentVariableIntValue("LANLINK_DEBUG") != 0;
    if (parser.isSet(debugOption)) {
        qputenv("LANLINK_DEBUG", "1");
    }

    const auto log_path = lanlink::app::default_log_file_path();
    lanlink::app::install_logging(lanlink::app::LogOptions{.path = log_path, .debug = debug})
        .inspect_err([](const lanlink::Error& error) {
            qCWarning(lanlink::lcNode).noquote() << error.qmessage();
        });
    qCInfo(lanlink::lcNode) << "logging to" << log_path;

    auto crypto_result = lanlink::crypto::init();
    if (crypto_result.is_err()) {
        qCCritical(lanlink::lcNode) << "Failed to initialize crypto:"
                                    << crypto_result.unwrap_err().message.c_str();
        return 1;
    }

    QSettings settings;
    auto node_settings = lanlink::app::load_settings(settings);
    if (parser.isSet(saveDirOption)) {
        node_settings.save_dir = parser.value(saveDirOption);
    }
    if (parser.isSet(hostnameOption)) {
        node_settings.hostname = parser.value(hostnameOption);
    }
    if (parser.isSet(ipOption)) {
        node_settings.local_ip = parser.value(ipOption);
    }
    if (!apply_port(parser, discoveryPortOption, node_settings.discovery_port)
        || !apply_port(parser, transferPortOption, node_settings.transfer_port)
        || !apply_port(parser, chatPortOption, node_settings.chat_port)
        || !apply_port(parser, clipboardPortOption, node_settings.clipboard_port)) {
        return 2;
    }

    auto state = std::make_shared<lanlink::core::SyncState>(node_settings.save_dir);
    auto storage = std::make_shared<lanlink::storage::LocalFileStorage>(state);
    lanlink::platform::SystemClipboard clipboard;

    lanlink::app::Node node(node_settings, state, storage, clipboard);
    lanlink::app::Console console(node, settings);
    QObject::connect(&console, &lanlink::app::Console::quitRequested, &app, &QCoreApplication::quit);

    // A failed subsystem is already reported through its own error event; the rest keep running.
    node.start().inspect_err([](const lanlink::Error& error) {
        qCWarning(lanlink::lcNode).noquote() << "started with failures:" << error.qmessage();
    });
    console.start();

    const int rc = app.exec();
    node.stop();
    return rc;
}
