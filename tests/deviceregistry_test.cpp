#include "upnp/castordeviceregistry.h"
#include "upnp/castorupnp.h"
#include "castornetwork.h"

#include <QHostAddress>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("Device registry", "[device-registry]") {
    CastorDeviceRegistry registry;
    QStringList usns = CastorUPNP::DeviceUSNs("ABC");

    foreach (const QString &usn, usns)
        registry.Register(CastorUPNPDescription(usn, CastorUPNP::TypeFromUSN(usn), "http://{}:80/d.xml",
                                                "Linux/6.1 UPnP/1.0 Castor/0.1", "max-age=66"));

    SECTION("one record per USN") {
        REQUIRE(registry.Count() == 6);
        registry.Register(CastorUPNPDescription(usns[0], "upnp:rootdevice", "http://{}:81/d.xml",
                                                "Linux/6.1 UPnP/1.0 Castor/0.1", "max-age=66"));
        REQUIRE(registry.Count() == 6);

        CastorUPNPDescription description;
        REQUIRE(registry.Get(usns[0], description));
        REQUIRE(description.GetLocation("h") == "http://h:81/d.xml");
    }

    SECTION("unregister") {
        REQUIRE(registry.Unregister(usns[1]));
        REQUIRE_FALSE(registry.Contains(usns[1]));
        REQUIRE_FALSE(registry.Unregister(usns[1]));
        REQUIRE_FALSE(registry.Unregister("uuid:unknown"));
        REQUIRE(registry.Count() == 5);
    }

    SECTION("find by search target") {
        REQUIRE(registry.Find("ssdp:all").size() == 6);
        REQUIRE(registry.Find("upnp:rootdevice").size() == 1);
        REQUIRE(registry.Find("uuid:ABC").size() == 1);
        REQUIRE(registry.Find("urn:schemas-upnp-org:service:AVTransport:1").first().GetUSN() ==
                "uuid:ABC::urn:schemas-upnp-org:service:AVTransport:1");
        REQUIRE(registry.Find("urn:schemas-upnp-org:device:MediaServer:1").isEmpty());
    }

    SECTION("clear") {
        registry.Clear();
        REQUIRE(registry.Count() == 0);
        REQUIRE(registry.GetUSNs().isEmpty());
    }
}

TEST_CASE("Device identity", "[upnp]") {
    QStringList usns = CastorUPNP::DeviceUSNs("1234");

    REQUIRE(usns.size() == 6);
    REQUIRE(usns[0] == "uuid:1234::upnp:rootdevice");
    REQUIRE(usns[1] == "uuid:1234");
    REQUIRE(usns[2] == "uuid:1234::urn:schemas-upnp-org:device:MediaRenderer:1");
    REQUIRE(usns[3] == "uuid:1234::urn:schemas-upnp-org:service:RenderingControl:1");
    REQUIRE(usns[4] == "uuid:1234::urn:schemas-upnp-org:service:ConnectionManager:1");
    REQUIRE(usns[5] == "uuid:1234::urn:schemas-upnp-org:service:AVTransport:1");

    REQUIRE(CastorUPNP::TypeFromUSN(usns[0]) == "upnp:rootdevice");
    REQUIRE(CastorUPNP::TypeFromUSN(usns[1]) == "uuid:1234");
    REQUIRE(CastorUPNP::TypeFromUSN(usns[5]) == "urn:schemas-upnp-org:service:AVTransport:1");
    REQUIRE(CastorUPNP::UUIDFromUSN(usns[2]) == "1234");
    REQUIRE(CastorUPNP::UUIDFromUSN("uuid:1234") == "1234");
    REQUIRE(CastorUPNP::UUIDFromUSN("upnp:rootdevice").isEmpty());
}

TEST_CASE("Subnet matching", "[network]") {
    REQUIRE(CastorNetwork::SameSubnet("192.168.1.10", "255.255.255.0", QHostAddress("192.168.1.50")));
    REQUIRE_FALSE(CastorNetwork::SameSubnet("192.168.1.10", "255.255.255.0", QHostAddress("192.168.2.50")));
    REQUIRE(CastorNetwork::SameSubnet("10.1.2.3", "255.0.0.0", QHostAddress("10.200.0.1")));
    REQUIRE_FALSE(CastorNetwork::SameSubnet("10.1.2.3", "bogus", QHostAddress("10.200.0.1")));
    REQUIRE_FALSE(CastorNetwork::SameSubnet("10.1.2.3", "255.0.0.0", QHostAddress("fe80::1")));

    CastorInterface parsed;
    REQUIRE(CastorNetwork::ParseInterface(" 172.16.0.4/255.255.0.0 ", parsed));
    REQUIRE(parsed.first == "172.16.0.4");
    REQUIRE(parsed.second == "255.255.0.0");
    REQUIRE_FALSE(CastorNetwork::ParseInterface("172.16.0.4", parsed));
    REQUIRE_FALSE(CastorNetwork::ParseInterface("eth0/255.255.0.0", parsed));
}
