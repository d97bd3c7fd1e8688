#include "http/castorhttphandler.h"
#include "http/castorhttpserver.h"

#include <QTime>
#include <QTcpSocket>
#include <QCoreApplication>
#include <catch2/catch_test_macros.hpp>

// Answers every connection with a fixed body. If a server is given, the handler
// uninstalls itself from it while the first connection is processed.
class EchoHandler : public CastorHTTPHandler
{
  public:
    EchoHandler(bool *Deleted = NULL, CastorHTTPServer *Server = NULL)
      : CastorHTTPHandler("Echo"),
        m_connections(0),
        m_reloads(0),
        m_deleted(Deleted),
        m_server(Server)
    {
    }

    void ProcessConnection(QTcpSocket *Socket)
    {
        m_connections++;

        if (m_server)
        {
            m_server->SetHandler(NULL);
            m_server = NULL;
        }

        QObject::connect(Socket, SIGNAL(disconnected()), Socket, SLOT(deleteLater()));
        Socket->write("castor");
        Socket->disconnectFromHost();
    }

    void Reload(void)
    {
        m_reloads++;
    }

    int m_connections;
    int m_reloads;

  protected:
    ~EchoHandler()
    {
        if (m_deleted)
            *m_deleted = true;
    }

  private:
    bool             *m_deleted;
    CastorHTTPServer *m_server;
};

static QByteArray ReadReply(int Port)
{
    QTcpSocket client;
    client.connectToHost(QHostAddress::LocalHost, Port);
    if (!client.waitForConnected(2000))
        return QByteArray();

    QByteArray reply;
    QTime timer;
    timer.start();
    while (timer.elapsed() < 5000 && client.state() != QAbstractSocket::UnconnectedState)
    {
        QCoreApplication::processEvents();
        if (client.waitForReadyRead(10))
            reply += client.readAll();
    }
    reply += client.readAll();
    return reply;
}

TEST_CASE("HTTP server port binding", "[http]") {
    CastorHTTPServer server;

    SECTION("any port") {
        REQUIRE(server.Open(0));
        REQUIRE(server.GetPort() > 0);
        REQUIRE(server.Open(0));
        server.Close();
        REQUIRE(server.GetPort() == 0);
    }

    SECTION("falls back when the port is taken") {
        QTcpServer blocker;
        REQUIRE(blocker.listen(QHostAddress::AnyIPv4, 0));
        int blocked = blocker.serverPort();

        REQUIRE(server.Open(blocked));
        REQUIRE(server.GetPort() > 0);
        REQUIRE(server.GetPort() != blocked);
    }
}

TEST_CASE("HTTP server connections", "[http]") {
    CastorHTTPServer server;
    REQUIRE(server.Open(0));

    SECTION("handed to the handler") {
        bool deleted = false;
        EchoHandler *handler = new EchoHandler(&deleted);
        REQUIRE_FALSE(handler->IsShared());
        server.SetHandler(handler);
        REQUIRE(server.GetHandler() == handler);
        REQUIRE(handler->IsShared());

        REQUIRE(ReadReply(server.GetPort()) == "castor");
        REQUIRE(handler->m_connections == 1);

        server.ReloadHandler();
        REQUIRE(handler->m_reloads == 1);

        // the server releases its reference, the creator still holds one
        server.SetHandler(NULL);
        REQUIRE_FALSE(deleted);
        handler->DownRef();
        REQUIRE(deleted);
    }

    SECTION("handler replaced while processing a connection") {
        bool deleted = false;
        EchoHandler *handler = new EchoHandler(&deleted, &server);
        server.SetHandler(handler);
        handler->DownRef();
        REQUIRE_FALSE(deleted);

        REQUIRE(ReadReply(server.GetPort()) == "castor");
        REQUIRE(server.GetHandler() == NULL);
        REQUIRE(deleted);
        server.ReloadHandler();
    }

    SECTION("handler released with the server") {
        bool deleted = false;
        EchoHandler *handler = new EchoHandler(&deleted);
        {
            CastorHTTPServer other;
            other.SetHandler(handler);
            handler->DownRef();
            REQUIRE_FALSE(deleted);
        }
        REQUIRE(deleted);
    }

    SECTION("closed without a handler") {
        REQUIRE(ReadReply(server.GetPort()).isEmpty());
    }
}
