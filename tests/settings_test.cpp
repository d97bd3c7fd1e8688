#include "castorlocaldefs.h"
#include "castorsettings.h"
#include "testhelpers.h"

#include <QRegExp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("Settings store", "[settings]") {
    StaticSettings settings;

    SECTION("defaults are stored") {
        REQUIRE(settings.GetSetting("Missing", QString("value")) == "value");
        REQUIRE(settings.GetSetting("Missing", QString("other")) == "value");
    }

    SECTION("typed values") {
        settings.SetSetting("Flag", true);
        settings.SetSetting("Number", (int)1234);
        REQUIRE(settings.GetSetting("Flag", false));
        REQUIRE(settings.GetSetting("Number", (int)0) == 1234);
        REQUIRE(settings.GetSetting("Number", QString()) == "1234");
    }

    SECTION("port defaults to zero") {
        REQUIRE(settings.GetPort() == 0);
        settings.SetSetting(CASTOR_SETTING_PORT, (int)8080);
        REQUIRE(settings.GetPort() == 8080);
    }
}

TEST_CASE("Settings device identity", "[settings]") {
    StaticSettings settings;

    SECTION("uuid is stable until refreshed") {
        QString uuid = settings.GetUSN();
        REQUIRE(QRegExp("[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}").exactMatch(uuid));
        REQUIRE(settings.GetUSN() == uuid);

        QString refreshed = settings.GetUSN(true);
        REQUIRE(refreshed != uuid);
        REQUIRE(settings.GetUSN() == refreshed);
    }

    SECTION("friendly name") {
        settings.SetSetting(CASTOR_SETTING_NAME, QString("Living Room"));
        REQUIRE(settings.GetFriendlyName() == "Living Room");

        settings.SetTemporaryFriendlyName("Castor(0042)");
        REQUIRE(settings.GetFriendlyName() == "Castor(0042)");
        REQUIRE(settings.GetSetting(CASTOR_SETTING_NAME, QString()) == "Living Room");
    }

    SECTION("server signature") {
        QString server = settings.GetServerInfo();
        REQUIRE(server.contains(" UPnP/1.0 Castor/"));
        REQUIRE(server.startsWith(CastorSettings::GetSystem() + "/"));
    }
}

TEST_CASE("Interface changes", "[settings]") {
    StaticSettings settings;

    REQUIRE(settings.GetIP().size() == 1);
    REQUIRE_FALSE(settings.IsIPChanged());

    settings.SetInterfaces(CastorInterfaceList() << CastorInterface("10.0.0.5", "255.0.0.0"));
    REQUIRE(settings.IsIPChanged());
    REQUIRE_FALSE(settings.IsIPChanged());
}
