#include "castorlocaldefs.h"
#include "upnp/castorssdpservice.h"
#include "upnp/castorssdpscheduler.h"
#include "testhelpers.h"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("SSDP service", "[ssdp-service]") {
    StaticSettings settings;
    settings.SetSetting(CASTOR_SETTING_PORT, (int)8080);
    CastorEventBus bus;

    FakeSSDPSocketSet *sockets = new FakeSSDPSocketSet();
    CastorSSDPService service(&settings, &bus, sockets);

    SECTION("advertises six records") {
        REQUIRE(service.Start() == CastorSSDPSocketSet::NoError);
        REQUIRE(service.GetSSDP()->IsRunning());

        QString uuid = settings.GetUSN();
        QStringList usns = service.GetSSDP()->GetUSNs();
        REQUIRE(usns.size() == 6);

        CastorUPNPDescription description;
        REQUIRE(service.GetSSDP()->GetRegistry()->Get("uuid:" + uuid + "::upnp:rootdevice", description));
        REQUIRE(description.GetType() == "upnp:rootdevice");
        REQUIRE(description.GetLocation() == "http://{}:8080/description.xml");
        REQUIRE(description.GetCacheControl() == "max-age=66");
        REQUIRE(description.GetServer() == settings.GetServerInfo());

        REQUIRE(service.GetSSDP()->GetRegistry()->Get("uuid:" + uuid, description));
        REQUIRE(description.GetType() == "uuid:" + uuid);

        service.Stop();
    }

    SECTION("notify topic") {
        REQUIRE(service.Start() == CastorSSDPSocketSet::NoError);
        bus.Publish(CASTOR_TOPIC_SSDP_NOTIFY);
        REQUIRE(sockets->CountMulticasts("NTS: ssdp:alive") == 12);
        service.Stop();
    }

    SECTION("update ip restarts without byebye") {
        REQUIRE(service.Start() == CastorSSDPSocketSet::NoError);
        settings.SetSetting(CASTOR_SETTING_PORT, (int)9090);

        bus.Publish(CASTOR_TOPIC_SSDP_UPDATE_IP);
        REQUIRE(sockets->OpenCount() == 2);
        REQUIRE(sockets->CountMulticasts("NTS: ssdp:byebye") == 0);
        REQUIRE(service.GetSSDP()->IsRunning());

        CastorUPNPDescription description;
        REQUIRE(service.GetSSDP()->GetRegistry()->Get("uuid:" + settings.GetUSN(), description));
        REQUIRE(description.GetLocation() == "http://{}:9090/description.xml");

        service.Stop();
    }

    SECTION("stop sends byebye and unsubscribes") {
        REQUIRE(service.Start() == CastorSSDPSocketSet::NoError);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_SSDP_NOTIFY) == 1);

        service.Stop();
        REQUIRE(sockets->CountMulticasts("NTS: ssdp:byebye") == 6);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_SSDP_NOTIFY) == 0);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_SSDP_UPDATE_IP) == 0);
        REQUIRE_FALSE(service.GetSSDP()->IsRunning());
    }

    SECTION("bind failure") {
        sockets->SetBindError(true);
        REQUIRE(service.Start() == CastorSSDPSocketSet::BindError);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_SSDP_NOTIFY) == 0);
    }
}

TEST_CASE("SSDP scheduler", "[ssdp-scheduler]") {
    StaticSettings settings;
    CastorEventBus bus;
    CountingHandler handler;
    bus.Subscribe(CASTOR_TOPIC_SSDP_NOTIFY, &handler);
    bus.Subscribe(CASTOR_TOPIC_SSDP_UPDATE_IP, &handler);

    // take the initial snapshot
    (void)settings.GetIP();

    CastorSSDPScheduler scheduler(&settings, &bus);

    SECTION("update every ten ticks") {
        for (int i = 0; i < 9; ++i)
            scheduler.Tick();

        REQUIRE(handler.Count(CASTOR_TOPIC_SSDP_UPDATE_IP) == 0);
        REQUIRE(handler.Count(CASTOR_TOPIC_SSDP_NOTIFY) == 9);
        REQUIRE(scheduler.GetCounter() == 9);

        scheduler.Tick();
        REQUIRE(handler.Count(CASTOR_TOPIC_SSDP_UPDATE_IP) == 1);
        REQUIRE(handler.Count(CASTOR_TOPIC_SSDP_NOTIFY) == 10);
        REQUIRE(scheduler.GetCounter() == 0);
    }

    SECTION("update on interface change") {
        scheduler.Tick();
        scheduler.Tick();
        REQUIRE(handler.Count(CASTOR_TOPIC_SSDP_UPDATE_IP) == 0);

        CastorInterfaceList interfaces;
        interfaces << CastorInterface("192.168.1.11", "255.255.255.0");
        settings.SetInterfaces(interfaces);

        scheduler.Tick();
        REQUIRE(handler.Count(CASTOR_TOPIC_SSDP_UPDATE_IP) == 1);
        REQUIRE(handler.Count(CASTOR_TOPIC_SSDP_NOTIFY) == 3);
        REQUIRE(scheduler.GetCounter() == 0);

        scheduler.Tick();
        REQUIRE(handler.Count(CASTOR_TOPIC_SSDP_UPDATE_IP) == 1);
    }
}
