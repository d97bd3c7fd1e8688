#include "castorlocaldefs.h"
#include "castorexitcodes.h"
#include "castorrenderer.h"
#include "castorprotocol.h"
#include "castorservice.h"
#include "castorplugincoordinator.h"
#include "http/castorhttpserver.h"
#include "upnp/castorssdpservice.h"
#include "testhelpers.h"

#include <QRegExp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("Service lifecycle", "[service]") {
    StaticSettings settings;
    CastorEventBus bus;
    FakeSSDPSocketSet *sockets = new FakeSSDPSocketSet();

    CastorRenderer *renderer = CastorRendererFactory::GetFactory("NullRenderer")->Create(&bus);
    CastorProtocol *protocol = CastorProtocolFactory::GetFactory("DefaultProtocol")->Create(&bus);
    CastorService service(&settings, &bus, renderer, protocol, sockets);

    SECTION("first start stores the bound port") {
        REQUIRE(settings.GetPort() == 0);
        QString uuid = settings.GetUSN();

        REQUIRE(service.Start() == GENERIC_EXIT_OK);
        REQUIRE(service.IsRunning());
        REQUIRE(service.GetPort() > 0);
        REQUIRE(settings.GetPort() == service.GetPort());
        REQUIRE(settings.GetUSN() != uuid);
        REQUIRE(QRegExp("Castor\\(\\d{4}\\)").exactMatch(service.GetFriendlyName()));

        // started, then restarted by the port update
        REQUIRE(sockets->OpenCount() == 2);
        REQUIRE(service.GetHTTPServer()->GetHandler() == protocol->GetHandler());
        REQUIRE(service.GetRendererPlugin()->GetRenderer() == renderer);

        CastorUPNPDescription description;
        REQUIRE(service.GetSSDPService()->GetSSDP()->GetRegistry()->Get("uuid:" + settings.GetUSN(), description));
        REQUIRE(description.GetLocation() == QString("http://{}:%1/description.xml").arg(service.GetPort()));
        REQUIRE_FALSE(service.GetSSDPService()->GetSSDP()->IsRegistered("uuid:" + uuid));

        // an unchanged port keeps the identity
        QString current = settings.GetUSN();
        REQUIRE_FALSE(service.CheckPort());
        REQUIRE(settings.GetUSN() == current);

        service.Stop();
        REQUIRE_FALSE(service.IsRunning());
        REQUIRE_FALSE(service.GetHTTPServer()->isListening());
        REQUIRE(sockets->CountMulticasts("NTS: ssdp:byebye") == 6);
        REQUIRE(bus.GetTopics().isEmpty());
    }

    SECTION("lost port regenerates the identity") {
        QTcpServer blocker;
        REQUIRE(blocker.listen(QHostAddress::AnyIPv4, 0));
        int blocked = blocker.serverPort();
        settings.SetSetting(CASTOR_SETTING_PORT, blocked);
        QString uuid = settings.GetUSN();

        REQUIRE(service.Start() == GENERIC_EXIT_OK);
        REQUIRE(service.GetPort() != blocked);
        REQUIRE(settings.GetPort() == service.GetPort());
        REQUIRE(settings.GetUSN() != uuid);
        REQUIRE(QRegExp("Castor\\(\\d{4}\\)").exactMatch(service.GetFriendlyName()));

        CastorUPNPDescription description;
        REQUIRE(service.GetSSDPService()->GetSSDP()->GetRegistry()->Get("uuid:" + settings.GetUSN(), description));
        REQUIRE_FALSE(service.GetSSDPService()->GetSSDP()->IsRegistered("uuid:" + uuid));

        service.Stop();
    }

    SECTION("SSDP bind failure") {
        sockets->SetBindError(true);

        REQUIRE(service.Start() == GENERIC_EXIT_SOCKET_ERROR);
        REQUIRE_FALSE(service.IsRunning());
        REQUIRE_FALSE(service.GetHTTPServer()->isListening());
        REQUIRE_FALSE(service.GetRendererPlugin()->IsRunning());
    }
}
