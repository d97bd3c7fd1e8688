/* Class CastorProtocol
*
* This file is part of the Castor project.
*
* Copyright (C) Mark Kendall 2013
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301,
* USA.
*/


// Qt
#include <QMutex>
#include <QTcpSocket>

// Castor
#include "castorlogging.h"
#include "castoreventbus.h"
#include "http/castorhttphandler.h"
#include "castorprotocol.h"

typedef struct
{
    CastorProtocol::Capability capability;
    const char                *topic;
} CastorProtocolTopic;

static const CastorProtocolTopic gProtocolTopics[] =
{
    { CastorProtocol::SetStatePosition,        "set_state_position"         },
    { CastorProtocol::SetStateDuration,        "set_state_duration"         },
    { CastorProtocol::SetStatePause,           "set_state_pause"            },
    { CastorProtocol::SetStatePlay,            "set_state_play"             },
    { CastorProtocol::SetStateStop,            "set_state_stop"             },
    { CastorProtocol::SetStateEOF,             "set_state_eof"              },
    { CastorProtocol::SetStateTransport,       "set_state_transport"        },
    { CastorProtocol::SetStateTransportError,  "set_state_transport_error"  },
    { CastorProtocol::SetStateMute,            "set_state_mute"             },
    { CastorProtocol::SetStateVolume,          "set_state_volume"           },
    { CastorProtocol::SetStateSpeed,           "set_state_speed"            },
    { CastorProtocol::SetStateDisplaySubtitle, "set_state_display_subtitle" },
    { CastorProtocol::SetStateURL,             "set_state_url"              },
    { CastorProtocol::NoCapabilities,          NULL                         }
};

/*! \class CastorProtocol
 *  \brief Base class for the network protocol spoken by the renderer.
 *
 * A protocol owns the state variables reported to control points (TransportState, Volume...)
 * and supplies the CastorHTTPHandler that answers control requests.
 *
 * State updates arrive either directly from the active renderer or through the event bus
 * topics returned by CapabilityToTopic (e.g. 'set_state_play').
 *
 * \sa CastorProtocolPlugin
 * \sa CastorRenderer
*/
QString CastorProtocol::CapabilityToTopic(Capability Cap)
{
    for (int i = 0; gProtocolTopics[i].topic; ++i)
        if (gProtocolTopics[i].capability == Cap)
            return QString(gProtocolTopics[i].topic);
    return QString();
}

CastorProtocol::Capability CastorProtocol::TopicToCapability(const QString &Topic)
{
    for (int i = 0; gProtocolTopics[i].topic; ++i)
        if (Topic == gProtocolTopics[i].topic)
            return gProtocolTopics[i].capability;
    return NoCapabilities;
}

QStringList CastorProtocol::CapabilityTopics(Capabilities Caps)
{
    QStringList result;
    for (int i = 0; gProtocolTopics[i].topic; ++i)
        if (Caps & gProtocolTopics[i].capability)
            result << QString(gProtocolTopics[i].topic);
    return result;
}

CastorProtocol::CastorProtocol(const QString &Name, CastorEventBus *Bus)
  : m_name(Name),
    m_bus(Bus),
    m_running(false),
    m_stateLock(new QMutex())
{
    ResetState();
}

CastorProtocol::~CastorProtocol()
{
    delete m_stateLock;
}

QString CastorProtocol::GetName(void)
{
    return m_name;
}

bool CastorProtocol::IsRunning(void)
{
    return m_running;
}

bool CastorProtocol::Start(void)
{
    LOG(VB_MEDIA, LOG_INFO, QString("Starting protocol '%1'").arg(m_name));
    ResetState();
    m_running = true;
    return true;
}

void CastorProtocol::Stop(void)
{
    LOG(VB_MEDIA, LOG_INFO, QString("Stopping protocol '%1'").arg(m_name));
    m_running = false;
}

bool CastorProtocol::Reload(void)
{
    Stop();
    return Start();
}

///\brief Call the state update for Cap with Arguments. Unsupported capabilities are ignored.
QVariant CastorProtocol::Invoke(Capability Cap, const QVariantList &Arguments)
{
    if (!(GetCapabilities() & Cap))
    {
        LOG(VB_MEDIA, LOG_DEBUG, QString("Protocol '%1' does not support '%2'").arg(m_name).arg(CapabilityToTopic(Cap)));
        return QVariant();
    }

    QVariant first = Arguments.value(0);

    switch (Cap)
    {
        case SetStatePosition:        StatePosition(first.toString()); break;
        case SetStateDuration:        StateDuration(first.toString()); break;
        case SetStatePause:           StatePause(); break;
        case SetStatePlay:            StatePlay(); break;
        case SetStateStop:            StateStop(); break;
        case SetStateEOF:             StateEOF(); break;
        case SetStateTransport:       StateTransport(first.toString()); break;
        case SetStateTransportError:  StateTransportError(); break;
        case SetStateMute:            StateMute(first.toBool()); break;
        case SetStateVolume:          StateVolume(first.toInt()); break;
        case SetStateSpeed:           StateSpeed(first.toString()); break;
        case SetStateDisplaySubtitle: StateDisplaySubtitle(first.toBool()); break;
        case SetStateURL:             StateURL(first.toString()); break;
        default:
            return QVariant();
    }

    return QVariant(true);
}

void CastorProtocol::SetState(const QString &Name, const QVariant &Value)
{
    {
        QMutexLocker locker(m_stateLock);
        if (m_state.value(Name) == Value)
            return;
        m_state.insert(Name, Value);
    }

    StateChanged(Name, Value);
}

QVariant CastorProtocol::GetState(const QString &Name)
{
    QMutexLocker locker(m_stateLock);
    return m_state.value(Name);
}

void CastorProtocol::StatePosition(const QString &Position)
{
    SetState(CASTOR_STATE_POSITION, Position);
}

void CastorProtocol::StateDuration(const QString &Duration)
{
    SetState(CASTOR_STATE_DURATION, Duration);
}

void CastorProtocol::StatePause(void)
{
    SetState(CASTOR_STATE_TRANSPORT, QString("PAUSED_PLAYBACK"));
}

void CastorProtocol::StatePlay(void)
{
    SetState(CASTOR_STATE_TRANSPORT, QString("PLAYING"));
}

void CastorProtocol::StateStop(void)
{
    SetState(CASTOR_STATE_TRANSPORT, QString("STOPPED"));
}

///\brief Playback reached the end of the media.
void CastorProtocol::StateEOF(void)
{
    SetState(CASTOR_STATE_TRANSPORT, QString("STOPPED"));
    SetState(CASTOR_STATE_POSITION, QString("00:00:00"));
}

///\brief State must be one of PLAYING, PAUSED_PLAYBACK, STOPPED or NO_MEDIA_PRESENT.
void CastorProtocol::StateTransport(const QString &State)
{
    if (State != "PLAYING" && State != "PAUSED_PLAYBACK" && State != "STOPPED" && State != "NO_MEDIA_PRESENT")
    {
        LOG(VB_MEDIA, LOG_WARNING, QString("Ignoring unknown transport state '%1'").arg(State));
        return;
    }

    SetState(CASTOR_STATE_TRANSPORT, State);
}

void CastorProtocol::StateTransportError(void)
{
    SetState(CASTOR_STATE_TRANSPORT_STATUS, QString("ERROR_OCCURRED"));
}

void CastorProtocol::StateMute(bool Mute)
{
    SetState(CASTOR_STATE_MUTE, Mute);
}

void CastorProtocol::StateVolume(int Volume)
{
    SetState(CASTOR_STATE_VOLUME, qBound(0, Volume, 100));
}

void CastorProtocol::StateSpeed(const QString &Speed)
{
    SetState(CASTOR_STATE_SPEED, Speed);
}

void CastorProtocol::StateDisplaySubtitle(bool Show)
{
    SetState(CASTOR_STATE_SUBTITLE, Show);
}

void CastorProtocol::StateURL(const QString &URL)
{
    SetState(CASTOR_STATE_URL, URL);
    SetState(CASTOR_STATE_TRANSPORT_STATUS, QString("OK"));
}

void CastorProtocol::StateChanged(const QString &Name, const QVariant &Value)
{
    LOG(VB_MEDIA, LOG_DEBUG, QString("%1: %2 = '%3'").arg(m_name).arg(Name).arg(Value.toString()));
}

void CastorProtocol::ResetState(void)
{
    QMutexLocker locker(m_stateLock);
    m_state.clear();
    m_state.insert(CASTOR_STATE_TRANSPORT,        QString("NO_MEDIA_PRESENT"));
    m_state.insert(CASTOR_STATE_TRANSPORT_STATUS, QString("OK"));
    m_state.insert(CASTOR_STATE_POSITION,         QString("00:00:00"));
    m_state.insert(CASTOR_STATE_DURATION,         QString("00:00:00"));
    m_state.insert(CASTOR_STATE_MUTE,             false);
    m_state.insert(CASTOR_STATE_VOLUME,           100);
    m_state.insert(CASTOR_STATE_SPEED,            QString("1"));
    m_state.insert(CASTOR_STATE_SUBTITLE,         true);
    m_state.insert(CASTOR_STATE_URL,              QString(""));
}

class DefaultHTTPHandler : public CastorHTTPHandler
{
  public:
    DefaultHTTPHandler()
      : CastorHTTPHandler("DefaultProtocol")
    {
    }

    void ProcessConnection(QTcpSocket *Socket)
    {
        if (!Socket)
            return;

        QObject::connect(Socket, SIGNAL(disconnected()), Socket, SLOT(deleteLater()));
        Socket->write("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
        Socket->disconnectFromHost();
    }
};

/*! \class DefaultProtocol
 *  \brief The built in protocol.
 *
 * DefaultProtocol keeps the state variables up to date but does not implement any control
 * requests. Its HTTP handler answers every connection with '404 Not Found'.
*/
class DefaultProtocol : public CastorProtocol
{
  public:
    explicit DefaultProtocol(CastorEventBus *Bus)
      : CastorProtocol("DefaultProtocol", Bus),
        m_handler(new DefaultHTTPHandler())
    {
    }

    ~DefaultProtocol()
    {
        m_handler->DownRef();
    }

    Capabilities GetCapabilities(void)
    {
        return SetStatePosition | SetStateDuration | SetStatePause | SetStatePlay | SetStateStop |
               SetStateEOF | SetStateTransport | SetStateTransportError | SetStateMute |
               SetStateVolume | SetStateSpeed | SetStateDisplaySubtitle | SetStateURL;
    }

    CastorHTTPHandler* GetHandler(void)
    {
        return m_handler;
    }

  private:
    DefaultHTTPHandler *m_handler;
};

class DefaultProtocolFactory : public CastorProtocolFactory
{
    QString Name(void)
    {
        return "DefaultProtocol";
    }

    CastorProtocol* Create(CastorEventBus *Bus)
    {
        return new DefaultProtocol(Bus);
    }
} DefaultProtocolFactory;

CastorProtocolFactory* CastorProtocolFactory::gCastorProtocolFactory = NULL;

CastorProtocolFactory::CastorProtocolFactory()
{
    nextCastorProtocolFactory = gCastorProtocolFactory;
    gCastorProtocolFactory = this;
}

CastorProtocolFactory::~CastorProtocolFactory()
{
}

CastorProtocolFactory* CastorProtocolFactory::GetCastorProtocolFactory(void)
{
    return gCastorProtocolFactory;
}

CastorProtocolFactory* CastorProtocolFactory::GetFactory(const QString &Name)
{
    CastorProtocolFactory* factory = gCastorProtocolFactory;
    for ( ; factory; factory = factory->NextFactory())
        if (factory->Name() == Name)
            return factory;
    return NULL;
}

CastorProtocolFactory* CastorProtocolFactory::NextFactory(void) const
{
    return nextCastorProtocolFactory;
}
