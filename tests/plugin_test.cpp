#include "castorplugin.h"
#include "castorrenderer.h"
#include "castorprotocol.h"
#include "castoreventbus.h"

#include <QFile>
#include <QTemporaryDir>
#include <catch2/catch_test_macros.hpp>

static void WriteFile(const QString &Path, const QByteArray &Data)
{
    QFile file(Path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(Data) == Data.size());
    file.close();
}

TEST_CASE("Plugin descriptor metadata", "[plugin]") {
    CastorPluginDescriptor descriptor;

    SECTION("complete header") {
        QByteArray data(
            "# <castor.title>Quiet Renderer</castor.title>\n"
            "# <castor.renderer>NullRenderer</castor.renderer>\n"
            "# <castor.platform>linux, darwin</castor.platform>\n"
            "// <castor.version>1.2</castor.version><castor.author>Castor</castor.author>\n"
            "# <castor.desc>Logs media commands</castor.desc>\n"
            "\n"
            "body = true\n"
            "# <castor.title>Ignored</castor.title>\n");

        REQUIRE(CastorPluginDescriptor::Parse("quiet.castor", data, descriptor));
        REQUIRE(descriptor.m_path == "quiet.castor");
        REQUIRE(descriptor.m_title == "Quiet Renderer");
        REQUIRE(descriptor.m_kind == CastorPluginDescriptor::Renderer);
        REQUIRE(descriptor.m_factory == "NullRenderer");
        REQUIRE(descriptor.m_platforms == (QStringList() << "linux" << "darwin"));
        REQUIRE(descriptor.m_version == "1.2");
        REQUIRE(descriptor.m_author == "Castor");
        REQUIRE(descriptor.m_description == "Logs media commands");
        REQUIRE_FALSE(descriptor.m_default);
        REQUIRE(descriptor.SupportsPlatform("linux"));
        REQUIRE_FALSE(descriptor.SupportsPlatform("win32"));
    }

    SECTION("protocol without title or platform") {
        REQUIRE(CastorPluginDescriptor::Parse("p.castor", QByteArray("#<castor.protocol>DefaultProtocol</castor.protocol>\n"), descriptor));
        REQUIRE(descriptor.m_kind == CastorPluginDescriptor::Protocol);
        REQUIRE(descriptor.m_title == "DefaultProtocol");
        REQUIRE(descriptor.SupportsPlatform("win32"));
    }

    SECTION("tags after the header are ignored") {
        QByteArray data(
            "# <castor.title>Late</castor.title>\n"
            "code();\n"
            "# <castor.renderer>NullRenderer</castor.renderer>\n");
        REQUIRE_FALSE(CastorPluginDescriptor::Parse("late.castor", data, descriptor));
    }
}

TEST_CASE("Plugin directory scan", "[plugin]") {
    QTemporaryDir directory;
    REQUIRE(directory.isValid());

    WriteFile(directory.path() + "/quiet.castor",
              "# <castor.title>Quiet</castor.title>\n"
              "# <castor.renderer>NullRenderer</castor.renderer>\n");
    WriteFile(directory.path() + "/unknown.castor",
              "# <castor.title>Unknown</castor.title>\n"
              "# <castor.renderer>NoSuchRenderer</castor.renderer>\n");
    WriteFile(directory.path() + "/elsewhere.castor",
              "# <castor.title>Elsewhere</castor.title>\n"
              "# <castor.renderer>NullRenderer</castor.renderer>\n"
              "# <castor.platform>beos</castor.platform>\n");
    WriteFile(directory.path() + "/invalid.castor", "nothing to see here\n");
    WriteFile(directory.path() + "/readme.txt",
              "# <castor.title>Text</castor.title>\n"
              "# <castor.renderer>NullRenderer</castor.renderer>\n");

    CastorPlugin plugins(directory.path());
    CastorEventBus bus;

    QList<CastorPluginDescriptor> renderers = plugins.GetRenderers();
    REQUIRE(renderers.size() == 2);
    REQUIRE(plugins.GetProtocols().size() == 1);

    CastorPluginDescriptor quiet = plugins.FindRenderer("Quiet");
    REQUIRE(quiet.m_title == "Quiet");
    REQUIRE(quiet.m_factory == "NullRenderer");
    REQUIRE_FALSE(quiet.m_default);

    CastorPluginDescriptor fallback = plugins.FindRenderer("Elsewhere");
    REQUIRE(fallback.m_default);
    REQUIRE(fallback.m_factory == "NullRenderer");

    REQUIRE(plugins.FindRenderer(QString()).m_default);
    REQUIRE(plugins.FindProtocol("Missing").m_factory == "DefaultProtocol");

    CastorRenderer *renderer = plugins.CreateRenderer(quiet, &bus);
    REQUIRE(renderer != NULL);
    REQUIRE(renderer->GetName() == "NullRenderer");
    delete renderer;

    CastorProtocol *protocol = plugins.CreateProtocol(plugins.FindProtocol(QString()), &bus);
    REQUIRE(protocol != NULL);
    REQUIRE(protocol->GetHandler() != NULL);
    delete protocol;

    CastorPluginDescriptor bogus(CastorPluginDescriptor::Renderer, "NoSuchRenderer");
    REQUIRE(plugins.CreateRenderer(bogus, &bus) == NULL);
    REQUIRE_FALSE(plugins.AddDescriptor(bogus));
}
