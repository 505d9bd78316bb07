#include "app/settings.hpp"

#include "network/discovery_beacon.hpp"
#include "network/transport.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QSysInfo>

namespace lanlink::app {

namespace {

quint16 read_port(QSettings& settings, const char* key, quint16 fallback) {
    bool ok = false;
    const int value = settings.value(QLatin1String(key)).toInt(&ok);
    if (!ok || value <= 0 || value > 65535) {
        return fallback;
    }
    return static_cast<quint16>(value);
}

QString read_string(QSettings& settings, const char* key, const QString& fallback) {
    const QString value = settings.value(QLatin1String(key)).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

} // namespace

NodeSettings load_settings(QSettings& settings) {
    NodeSettings out;
    out.hostname = read_string(settings, kSettingsHostname, default_hostname());
    out.save_dir = read_string(settings, kSettingsSaveDir, default_save_dir());
    out.local_ip = read_string(settings, kSettingsLocalIp, QString());
    out.discovery_port = read_port(settings, kSettingsDiscoveryPort, network::kDefaultDiscoveryPort);
    out.transfer_port = read_port(settings, kSettingsTransferPort, network::kDefaultTransferPort);
    out.chat_port = read_port(settings, kSettingsChatPort, network::kDefaultChatPort);
    out.clipboard_port = read_port(settings, kSettingsClipboardPort, network::kDefaultClipboardPort);
    out.multicast_group = read_string(settings, kSettingsMulticastGroup,
                                      QString::fromLatin1(network::kDefaultMulticastGroup));
    return out;
}

void store_save_dir(QSettings& settings, const QString& dir) {
    settings.setValue(QLatin1String(kSettingsSaveDir), dir);
}

QString default_save_dir() {
    const auto downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (!downloads.isEmpty()) {
        return downloads;
    }
    return QDir::homePath();
}

QString default_hostname() {
    const auto name = QSysInfo::machineHostName().trimmed();
    return name.isEmpty() ? QStringLiteral("lanlink") : name;
}

} // namespace lanlink::app
