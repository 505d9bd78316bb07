#pragma once

#include <QString>

class QSettings;

namespace lanlink::app {

/**
 * Everything a node needs to start. Protocol defaults live in the
 * network/transfer headers; these fields only override them.
 */
struct NodeSettings {
    QString hostname;
    QString save_dir;
    // Empty means detect at startup.
    QString local_ip;
    quint16 discovery_port = 0;
    quint16 transfer_port = 0;
    quint16 chat_port = 0;
    quint16 clipboard_port = 0;
    QString multicast_group;
};

constexpr const char* kSettingsHostname = "node/hostname";
constexpr const char* kSettingsSaveDir = "node/save_dir";
constexpr const char* kSettingsLocalIp = "node/local_ip";
constexpr const char* kSettingsDiscoveryPort = "ports/discovery";
constexpr const char* kSettingsTransferPort = "ports/transfer";
constexpr const char* kSettingsChatPort = "ports/chat";
constexpr const char* kSettingsClipboardPort = "ports/clipboard";
constexpr const char* kSettingsMulticastGroup = "discovery/group";

/**
 * Read settings, filling gaps with defaults.
 */
NodeSettings load_settings(QSettings& settings);

/**
 * Persist the save directory chosen at runtime.
 */
void store_save_dir(QSettings& settings, const QString& dir);

/**
 * The platform download folder, falling back to the home directory.
 */
QString default_save_dir();

QString default_hostname();

} // namespace lanlink::app
