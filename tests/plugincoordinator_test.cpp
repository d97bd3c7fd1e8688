#include "castorlocaldefs.h"
#include "castorplugincoordinator.h"
#include "http/castorhttphandler.h"
#include "testhelpers.h"

#include <QTime>
#include <QThread>
#include <QAtomicInt>
#include <catch2/catch_test_macros.hpp>

class RendererTracker
{
  public:
    RendererTracker() : m_started(0), m_stopped(0), m_deleted(0), m_volume(-1) {}

    int m_started;
    int m_stopped;
    int m_deleted;
    int m_volume;
};

class TestRenderer : public CastorRenderer
{
  public:
    TestRenderer(const QString &Name, CastorEventBus *Bus, RendererTracker *Tracker,
                 Capabilities Caps, bool StartFails = false)
      : CastorRenderer(Name, Bus),
        m_tracker(Tracker),
        m_capabilities(Caps),
        m_startFails(StartFails)
    {
    }

    ~TestRenderer()
    {
        m_tracker->m_deleted++;
    }

    bool Start(void)
    {
        if (m_startFails)
            return false;
        m_tracker->m_started++;
        return CastorRenderer::Start();
    }

    void Stop(void)
    {
        m_tracker->m_stopped++;
        CastorRenderer::Stop();
    }

    Capabilities GetCapabilities(void)
    {
        return m_capabilities;
    }

  protected:
    void MediaVolume(int Volume)
    {
        m_tracker->m_volume = Volume;
    }

  private:
    RendererTracker *m_tracker;
    Capabilities     m_capabilities;
    bool             m_startFails;
};

class TestProtocol : public CastorProtocol
{
  public:
    TestProtocol(const QString &Name, CastorEventBus *Bus)
      : CastorProtocol(Name, Bus),
        m_handler(new Handler(Name))
    {
    }

    ~TestProtocol()
    {
        m_handler->DownRef();
    }

    Capabilities GetCapabilities(void)
    {
        return SetStatePlay | SetStateVolume;
    }

    CastorHTTPHandler* GetHandler(void)
    {
        return m_handler;
    }

  private:
    class Handler : public CastorHTTPHandler
    {
      public:
        explicit Handler(const QString &Name) : CastorHTTPHandler(Name) {}
        void ProcessConnection(QTcpSocket *Socket) { (void)Socket; }
    };

    Handler *m_handler;
};

TEST_CASE("Renderer coordinator", "[plugin-coordinator]") {
    CastorEventBus bus;
    RendererTracker first;
    RendererTracker second;

    CastorRendererPlugin plugin(&bus, new TestRenderer("First", &bus, &first,
                                                       CastorRenderer::SetMediaStop | CastorRenderer::SetMediaVolume));
    int failures = 0;
    QObject::connect(&plugin, &CastorPluginCoordinator::Failed, [&failures](const QString &) { failures++; });

    REQUIRE(plugin.Start());
    REQUIRE(plugin.IsRunning());
    REQUIRE(first.m_started == 1);

    SECTION("capabilities and control topics are subscribed") {
        REQUIRE(bus.HandlerCount("set_media_stop") == 1);
        REQUIRE(bus.HandlerCount("set_media_volume") == 1);
        REQUIRE(bus.HandlerCount("set_media_url") == 0);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_GET_RENDERER) == 1);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_SET_RENDERER) == 1);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_RELOAD_RENDERER) == 1);
        REQUIRE(plugin.GetTopics().size() == 5);
    }

    SECTION("media commands reach the renderer") {
        bus.Publish("set_media_volume", QVariantList() << 42);
        REQUIRE(first.m_volume == 42);
    }

    SECTION("get renderer") {
        QVariantList result = bus.Publish(CASTOR_TOPIC_GET_RENDERER);
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].value<CastorRenderer*>() == plugin.GetRenderer());
    }

    SECTION("reload") {
        bus.Publish(CASTOR_TOPIC_RELOAD_RENDERER);
        REQUIRE(first.m_stopped == 1);
        REQUIRE(first.m_started == 2);
    }

    SECTION("swap") {
        CastorRenderer *renderer = new TestRenderer("Second", &bus, &second, CastorRenderer::SetMediaURL);
        REQUIRE(plugin.SetRenderer(renderer));

        REQUIRE(first.m_stopped == 1);
        REQUIRE(first.m_deleted == 1);
        REQUIRE(second.m_started == 1);
        REQUIRE(plugin.GetRenderer() == renderer);
        REQUIRE(plugin.IsRunning());

        REQUIRE(bus.HandlerCount("set_media_stop") == 0);
        REQUIRE(bus.HandlerCount("set_media_volume") == 0);
        REQUIRE(bus.HandlerCount("set_media_url") == 1);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_GET_RENDERER) == 1);
        REQUIRE(plugin.GetCapabilities() == CastorRenderer::Capabilities(CastorRenderer::SetMediaURL));
    }

    SECTION("swap through the event bus") {
        CastorRenderer *renderer = new TestRenderer("Second", &bus, &second, CastorRenderer::SetMediaStop);
        QVariantList result = bus.Publish(CASTOR_TOPIC_SET_RENDERER, QVariantList() << QVariant::fromValue(renderer));
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].toBool());
        REQUIRE(plugin.GetRenderer() == renderer);
        REQUIRE(first.m_deleted == 1);
    }

    SECTION("invalid renderer is ignored") {
        CastorRenderer *current = plugin.GetRenderer();
        REQUIRE_FALSE(plugin.SetRenderer(NULL));

        QVariantList result = bus.Publish(CASTOR_TOPIC_SET_RENDERER, QVariantList() << QVariant());
        REQUIRE(result.size() == 1);
        REQUIRE_FALSE(result[0].toBool());

        REQUIRE(plugin.GetRenderer() == current);
        REQUIRE(plugin.IsRunning());
        REQUIRE(first.m_stopped == 0);
        REQUIRE(first.m_deleted == 0);
        REQUIRE(failures == 0);
        REQUIRE(bus.HandlerCount("set_media_volume") == 1);
    }

    SECTION("swap to a renderer that fails to start") {
        REQUIRE_FALSE(plugin.SetRenderer(new TestRenderer("Broken", &bus, &second, CastorRenderer::SetMediaStop, true)));
        REQUIRE(plugin.GetRenderer() == NULL);
        REQUIRE_FALSE(plugin.IsRunning());
        REQUIRE(second.m_deleted == 1);
        REQUIRE(failures == 1);
        REQUIRE(bus.HandlerCount("set_media_stop") == 0);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_GET_RENDERER) == 0);
    }

    SECTION("stop unsubscribes everything") {
        plugin.Stop();
        REQUIRE(first.m_stopped == 1);
        REQUIRE_FALSE(plugin.IsRunning());
        REQUIRE(bus.GetTopics().isEmpty());
    }
}

TEST_CASE("Renderer coordinator while stopped", "[plugin-coordinator]") {
    CastorEventBus bus;
    RendererTracker first;
    RendererTracker second;
    CastorRendererPlugin plugin(&bus, new TestRenderer("First", &bus, &first, CastorRenderer::SetMediaStop));

    SECTION("published renderer stays with the publisher") {
        TestRenderer *renderer = new TestRenderer("Second", &bus, &second, CastorRenderer::SetMediaStop);
        REQUIRE(bus.Publish(CASTOR_TOPIC_SET_RENDERER, QVariantList() << QVariant::fromValue<CastorRenderer*>(renderer)).isEmpty());
        REQUIRE(plugin.GetRenderer() != renderer);
        REQUIRE(second.m_deleted == 0);

        delete renderer;
        REQUIRE(second.m_deleted == 1);
        REQUIRE(first.m_deleted == 0);
    }

    SECTION("direct swap does not start the renderer") {
        CastorRenderer *renderer = new TestRenderer("Second", &bus, &second, CastorRenderer::SetMediaStop);
        REQUIRE(plugin.SetRenderer(renderer));
        REQUIRE(plugin.GetRenderer() == renderer);
        REQUIRE(first.m_deleted == 1);
        REQUIRE(second.m_started == 0);
        REQUIRE_FALSE(plugin.IsRunning());
        REQUIRE(bus.GetTopics().isEmpty());
    }
}

TEST_CASE("Protocol coordinator", "[plugin-coordinator]") {
    CastorEventBus bus;
    CastorProtocolPlugin plugin(&bus, new TestProtocol("First", &bus));

    QList<CastorProtocol*> changes;
    QObject::connect(&plugin, &CastorProtocolPlugin::ProtocolChanged, [&changes](CastorProtocol *Protocol) { changes.append(Protocol); });

    REQUIRE(plugin.Start());
    REQUIRE(bus.HandlerCount("set_state_play") == 1);
    REQUIRE(bus.HandlerCount("set_state_volume") == 1);
    REQUIRE(bus.HandlerCount("set_state_pause") == 0);

    SECTION("state updates") {
        bus.Publish("set_state_play");
        bus.Publish("set_state_volume", QVariantList() << 150);
        REQUIRE(plugin.GetProtocol()->GetState(CASTOR_STATE_TRANSPORT).toString() == "PLAYING");
        REQUIRE(plugin.GetProtocol()->GetState(CASTOR_STATE_VOLUME).toInt() == 100);
    }

    SECTION("swap") {
        CastorProtocol *protocol = new TestProtocol("Second", &bus);
        REQUIRE(plugin.SetProtocol(protocol));
        REQUIRE(plugin.GetProtocol() == protocol);
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[0] == NULL);
        REQUIRE(changes[1] == protocol);
        REQUIRE(bus.HandlerCount(CASTOR_TOPIC_GET_PROTOCOL) == 1);
    }

    SECTION("invalid protocol is ignored") {
        CastorProtocol *current = plugin.GetProtocol();
        QVariantList result = bus.Publish(CASTOR_TOPIC_SET_PROTOCOL, QVariantList() << QVariant());
        REQUIRE(result.size() == 1);
        REQUIRE_FALSE(result[0].toBool());
        REQUIRE(plugin.GetProtocol() == current);
        REQUIRE(plugin.IsRunning());
        REQUIRE(changes.isEmpty());
    }

    SECTION("reload") {
        bus.Publish("set_state_play");
        REQUIRE(bus.Publish(CASTOR_TOPIC_RELOAD_PROTOCOL)[0].toBool());
        REQUIRE(plugin.GetProtocol()->GetState(CASTOR_STATE_TRANSPORT).toString() == "NO_MEDIA_PRESENT");
        REQUIRE(changes.size() == 1);
    }
}

TEST_CASE("Built in renderer and protocol", "[plugin-coordinator]") {
    CastorEventBus bus;

    CastorRendererFactory *rendererfactory = CastorRendererFactory::GetFactory("NullRenderer");
    CastorProtocolFactory *protocolfactory = CastorProtocolFactory::GetFactory("DefaultProtocol");
    REQUIRE(rendererfactory != NULL);
    REQUIRE(protocolfactory != NULL);
    REQUIRE(CastorRendererFactory::GetFactory("NoSuchRenderer") == NULL);

    CountingHandler stops;
    bus.Subscribe(CASTOR_TOPIC_RENDERER_AV_STOP, &stops);
    CastorProtocolPlugin protocols(&bus, protocolfactory->Create(&bus));
    CastorRendererPlugin renderers(&bus, rendererfactory->Create(&bus));

    REQUIRE(protocols.Start());
    REQUIRE(renderers.Start());
    REQUIRE(protocols.GetProtocol()->GetHandler() != NULL);

    CastorProtocol *protocol = protocols.GetProtocol();
    REQUIRE(protocol->GetState(CASTOR_STATE_TRANSPORT).toString() == "NO_MEDIA_PRESENT");

    bus.Publish("set_media_url", QVariantList() << QString("http://10.0.0.2/a.mp3") << QString("A"));
    REQUIRE(protocol->GetState(CASTOR_STATE_TRANSPORT).toString() == "PLAYING");
    REQUIRE(protocol->GetState(CASTOR_STATE_URL).toString() == "http://10.0.0.2/a.mp3");

    bus.Publish("set_media_pause");
    REQUIRE(protocol->GetState(CASTOR_STATE_TRANSPORT).toString() == "PAUSED_PLAYBACK");

    bus.Publish("set_media_mute", QVariantList() << true);
    REQUIRE(protocol->GetState(CASTOR_STATE_MUTE).toBool());

    bus.Publish("set_media_stop");
    REQUIRE(protocol->GetState(CASTOR_STATE_TRANSPORT).toString() == "STOPPED");

    // renderer state follows the active protocol across a swap
    CastorProtocol *next = protocolfactory->Create(&bus);
    REQUIRE(protocols.SetProtocol(next));
    REQUIRE(next->GetState(CASTOR_STATE_TRANSPORT).toString() == "NO_MEDIA_PRESENT");
    bus.Publish("set_media_resume");
    REQUIRE(next->GetState(CASTOR_STATE_TRANSPORT).toString() == "PLAYING");

    renderers.Stop();
    REQUIRE(stops.Count(CASTOR_TOPIC_RENDERER_AV_STOP) == 1);
}

// Shared by every renderer created during a swap test, so it outlives them.
class SwapTracker
{
  public:
    QAtomicInt m_calls;
    QAtomicInt m_unsupported;
    QAtomicInt m_afterStop;
};

class SwapRenderer : public CastorRenderer
{
  public:
    SwapRenderer(CastorEventBus *Bus, SwapTracker *Tracker, Capabilities Caps)
      : CastorRenderer("Swap", Bus),
        m_tracker(Tracker),
        m_capabilities(Caps),
        m_stopped(0)
    {
    }

    void Stop(void)
    {
        m_stopped.storeRelease(1);
        CastorRenderer::Stop();
    }

    Capabilities GetCapabilities(void)
    {
        return m_capabilities;
    }

  protected:
    void MediaStop(void)                           { Record(SetMediaStop);   }
    void MediaVolume(int)                          { Record(SetMediaVolume); }
    void MediaMute(bool)                           { Record(SetMediaMute);   }
    void MediaURL(const QString&, const QString&)  { Record(SetMediaURL);    }

  private:
    void Record(Capability Cap)
    {
        m_tracker->m_calls.ref();
        if (!(m_capabilities & Cap))
            m_tracker->m_unsupported.ref();
        if (m_stopped.loadAcquire())
            m_tracker->m_afterStop.ref();
    }

    SwapTracker  *m_tracker;
    Capabilities  m_capabilities;
    QAtomicInt    m_stopped;
};

// Publishes media commands until told to finish.
class MediaPublisher : public QThread
{
  public:
    explicit MediaPublisher(CastorEventBus *Bus)
      : QThread(),
        m_bus(Bus),
        m_done(0),
        m_iterations(0)
    {
    }

    void Finish(void)
    {
        m_done.storeRelease(1);
    }

    int Iterations(void)
    {
        return m_iterations.loadAcquire();
    }

  protected:
    void run(void)
    {
        while (!m_done.loadAcquire())
        {
            m_bus->Publish("set_media_stop");
            m_bus->Publish("set_media_volume", QVariantList() << 10);
            m_bus->Publish("set_media_mute", QVariantList() << true);
            m_bus->Publish("set_media_url", QVariantList() << QString("http://10.0.0.2/a.mp3") << QString("A"));
            m_iterations.ref();
        }
    }

  private:
    CastorEventBus *m_bus;
    QAtomicInt      m_done;
    QAtomicInt      m_iterations;
};

TEST_CASE("Renderer swap under concurrent media commands", "[plugin-coordinator][threads]") {
    CastorEventBus bus;
    SwapTracker tracker;

    CastorRenderer::Capabilities even = CastorRenderer::SetMediaStop | CastorRenderer::SetMediaVolume;
    CastorRenderer::Capabilities odd  = CastorRenderer::SetMediaMute | CastorRenderer::SetMediaURL;

    CastorRendererPlugin plugin(&bus, new SwapRenderer(&bus, &tracker, even));
    REQUIRE(plugin.Start());

    MediaPublisher publisher(&bus);
    publisher.start();

    QTime timer;
    timer.start();
    while (publisher.Iterations() < 10 && timer.elapsed() < 5000)
        QThread::yieldCurrentThread();
    REQUIRE(publisher.Iterations() >= 10);

    for (int i = 0; i < 200; ++i)
    {
        CastorRenderer *renderer = new SwapRenderer(&bus, &tracker, (i % 2) ? even : odd);
        QVariantList result = bus.Publish(CASTOR_TOPIC_SET_RENDERER, QVariantList() << QVariant::fromValue(renderer));
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].toBool());
    }

    publisher.Finish();
    REQUIRE(publisher.wait(5000));

    REQUIRE(tracker.m_calls.loadAcquire() > 0);
    REQUIRE(tracker.m_unsupported.loadAcquire() == 0);
    REQUIRE(tracker.m_afterStop.loadAcquire() == 0);

    plugin.Stop();
    REQUIRE(bus.GetTopics().isEmpty());
}
