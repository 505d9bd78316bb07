#include <catch2/catch_test_macros.hpp>

#include "app/settings.hpp"
#include "network/discovery_beacon.hpp"
#include "network/transport.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace lanlink;
using namespace lanlink::app;

TEST_CASE("Settings: defaults fill an empty store", "[settings]") {
    QTemporaryDir dir;
    QSettings store(dir.filePath(QStringLiteral("lanlink.ini")), QSettings::IniFormat);

    const auto settings = load_settings(store);

    REQUIRE(settings.discovery_port == 37821);
    REQUIRE(settings.transfer_port == 7878);
    REQUIRE(settings.chat_port == 7879);
    REQUIRE(settings.clipboard_port == 7880);
    REQUIRE(settings.multicast_group == QStringLiteral("239.255.77.88"));
    REQUIRE(settings.local_ip.isEmpty());
    REQUIRE_FALSE(settings.hostname.isEmpty());
    REQUIRE(settings.save_dir == default_save_dir());
}

TEST_CASE("Settings: stored values override defaults", "[settings]") {
    QTemporaryDir dir;
    QSettings store(dir.filePath(QStringLiteral("lanlink.ini")), QSettings::IniFormat);
    store.setValue(QLatin1String(kSettingsHostname), QStringLiteral("kitchen"));
    store.setValue(QLatin1String(kSettingsTransferPort), 9000);
    store.setValue(QLatin1String(kSettingsChatPort), 70000);
    store_save_dir(store, QStringLiteral("/srv/inbox"));

    const auto settings = load_settings(store);

    REQUIRE(settings.hostname == QStringLiteral("kitchen"));
    REQUIRE(settings.transfer_port == 9000);
    REQUIRE(settings.chat_port == network::kDefaultChatPort);
    REQUIRE(settings.save_dir == QStringLiteral("/srv/inbox"));
}

TEST_CASE("Settings: default save directory is never empty", "[settings]") {
    REQUIRE_FALSE(default_save_dir().isEmpty());
}
