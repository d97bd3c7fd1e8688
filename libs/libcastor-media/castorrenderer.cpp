/* Class CastorRenderer
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


// Castor
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castoreventbus.h"
#include "castorprotocol.h"
#include "castorrenderer.h"

typedef struct
{
    CastorRenderer::Capability capability;
    const char                *topic;
} CastorRendererTopic;

static const CastorRendererTopic gRendererTopics[] =
{
    { CastorRenderer::SetMediaStop,     "set_media_stop"     },
    { CastorRenderer::SetMediaPause,    "set_media_pause"    },
    { CastorRenderer::SetMediaResume,   "set_media_resume"   },
    { CastorRenderer::SetMediaVolume,   "set_media_volume"   },
    { CastorRenderer::SetMediaMute,     "set_media_mute"     },
    { CastorRenderer::SetMediaURL,      "set_media_url"      },
    { CastorRenderer::SetMediaTitle,    "set_media_title"    },
    { CastorRenderer::SetMediaPosition, "set_media_position" },
    { CastorRenderer::SetMediaSubFile,  "set_media_sub_file" },
    { CastorRenderer::SetMediaSubShow,  "set_media_sub_show" },
    { CastorRenderer::SetMediaText,     "set_media_text"     },
    { CastorRenderer::SetMediaSpeed,    "set_media_speed"    },
    { CastorRenderer::NoCapabilities,   NULL                 }
};

/*! \class CastorRenderer
 *  \brief Base class for media renderers.
 *
 * A renderer controls a media player. It declares the media commands it supports through
 * GetCapabilities and each supported command is delivered through the event bus topic
 * returned by CapabilityToTopic (e.g. 'set_media_url').
 *
 * Renderers report player state changes (position, transport state, volume...) to the
 * active protocol by publishing its 'set_state_' topics.
 *
 * Subclass CastorRenderer, reimplement GetCapabilities and the matching Media methods and
 * register a CastorRendererFactory.
 *
 * \sa CastorRendererPlugin
 * \sa CastorProtocol
*/
QString CastorRenderer::CapabilityToTopic(Capability Cap)
{
    for (int i = 0; gRendererTopics[i].topic; ++i)
        if (gRendererTopics[i].capability == Cap)
            return QString(gRendererTopics[i].topic);
    return QString();
}

CastorRenderer::Capability CastorRenderer::TopicToCapability(const QString &Topic)
{
    for (int i = 0; gRendererTopics[i].topic; ++i)
        if (Topic == gRendererTopics[i].topic)
            return gRendererTopics[i].capability;
    return NoCapabilities;
}

QStringList CastorRenderer::CapabilityTopics(Capabilities Caps)
{
    QStringList result;
    for (int i = 0; gRendererTopics[i].topic; ++i)
        if (Caps & gRendererTopics[i].capability)
            result << QString(gRendererTopics[i].topic);
    return result;
}

CastorRenderer::CastorRenderer(const QString &Name, CastorEventBus *Bus)
  : m_name(Name),
    m_bus(Bus),
    m_running(false)
{
}

CastorRenderer::~CastorRenderer()
{
}

QString CastorRenderer::GetName(void)
{
    return m_name;
}

bool CastorRenderer::IsRunning(void)
{
    return m_running;
}

bool CastorRenderer::Start(void)
{
    LOG(VB_MEDIA, LOG_INFO, QString("Starting renderer '%1'").arg(m_name));
    m_running = true;
    return true;
}

///\brief Stop the renderer and tell interested parties that playback has stopped.
void CastorRenderer::Stop(void)
{
    LOG(VB_MEDIA, LOG_INFO, QString("Stopping renderer '%1'").arg(m_name));
    m_running = false;
    if (m_bus)
        m_bus->Publish(CASTOR_TOPIC_RENDERER_AV_STOP);
}

bool CastorRenderer::Reload(void)
{
    Stop();
    return Start();
}

/*! \brief Call the media command for Cap with Arguments.
 *
 * Missing arguments are replaced with defaults. Capabilities not supported by this renderer
 * are ignored.
*/
QVariant CastorRenderer::Invoke(Capability Cap, const QVariantList &Arguments)
{
    if (!(GetCapabilities() & Cap))
    {
        LOG(VB_MEDIA, LOG_DEBUG, QString("Renderer '%1' does not support '%2'").arg(m_name).arg(CapabilityToTopic(Cap)));
        return QVariant();
    }

    QVariant first  = Arguments.value(0);
    QVariant second = Arguments.value(1);

    switch (Cap)
    {
        case SetMediaStop:     MediaStop(); break;
        case SetMediaPause:    MediaPause(); break;
        case SetMediaResume:   MediaResume(); break;
        case SetMediaVolume:   MediaVolume(first.toInt()); break;
        case SetMediaMute:     MediaMute(first.toBool()); break;
        case SetMediaURL:      MediaURL(first.toString(), second.toString()); break;
        case SetMediaTitle:    MediaTitle(first.toString()); break;
        case SetMediaPosition: MediaPosition(first.toString()); break;
        case SetMediaSubFile:  MediaSubFile(first.toString()); break;
        case SetMediaSubShow:  MediaSubShow(first.toBool()); break;
        case SetMediaText:     MediaText(first.toString(), second.isValid() ? second.toInt() : 1000); break;
        case SetMediaSpeed:    MediaSpeed(first.isValid() ? first.toDouble() : 1.0); break;
        default:
            return QVariant();
    }

    return QVariant(true);
}

void CastorRenderer::MediaStop(void)
{
}

void CastorRenderer::MediaPause(void)
{
}

void CastorRenderer::MediaResume(void)
{
}

void CastorRenderer::MediaVolume(int Volume)
{
    (void)Volume;
}

void CastorRenderer::MediaMute(bool Mute)
{
    (void)Mute;
}

void CastorRenderer::MediaURL(const QString &URL, const QString &Title)
{
    (void)URL;
    (void)Title;
}

void CastorRenderer::MediaTitle(const QString &Title)
{
    (void)Title;
}

void CastorRenderer::MediaPosition(const QString &Position)
{
    (void)Position;
}

void CastorRenderer::MediaSubFile(const QString &File)
{
    (void)File;
}

void CastorRenderer::MediaSubShow(bool Show)
{
    (void)Show;
}

void CastorRenderer::MediaText(const QString &Text, int Duration)
{
    (void)Text;
    (void)Duration;
}

void CastorRenderer::MediaSpeed(double Speed)
{
    (void)Speed;
}

///\brief Publish the 'set_state_' topic for Cap. The protocol coordinator applies it under its lock.
void CastorRenderer::PublishState(int Cap, const QVariantList &Arguments)
{
    if (!m_bus)
        return;

    QString topic = CastorProtocol::CapabilityToTopic((CastorProtocol::Capability)Cap);
    if (m_bus->Publish(topic, Arguments).isEmpty())
        LOG(VB_MEDIA, LOG_DEBUG, QString("No protocol accepted '%1'").arg(topic));
}

void CastorRenderer::StatePosition(const QString &Position)
{
    PublishState(CastorProtocol::SetStatePosition, QVariantList() << Position);
}

void CastorRenderer::StateDuration(const QString &Duration)
{
    PublishState(CastorProtocol::SetStateDuration, QVariantList() << Duration);
}

void CastorRenderer::StatePause(void)
{
    PublishState(CastorProtocol::SetStatePause);
}

void CastorRenderer::StatePlay(void)
{
    PublishState(CastorProtocol::SetStatePlay);
}

void CastorRenderer::StateStop(void)
{
    PublishState(CastorProtocol::SetStateStop);
}

void CastorRenderer::StateEOF(void)
{
    PublishState(CastorProtocol::SetStateEOF);
}

void CastorRenderer::StateTransport(const QString &State)
{
    PublishState(CastorProtocol::SetStateTransport, QVariantList() << State);
}

void CastorRenderer::StateTransportError(void)
{
    PublishState(CastorProtocol::SetStateTransportError);
}

void CastorRenderer::StateMute(bool Mute)
{
    PublishState(CastorProtocol::SetStateMute, QVariantList() << Mute);
}

void CastorRenderer::StateVolume(int Volume)
{
    PublishState(CastorProtocol::SetStateVolume, QVariantList() << Volume);
}

void CastorRenderer::StateSpeed(const QString &Speed)
{
    PublishState(CastorProtocol::SetStateSpeed, QVariantList() << Speed);
}

void CastorRenderer::StateSubtitle(bool Show)
{
    PublishState(CastorProtocol::SetStateDisplaySubtitle, QVariantList() << Show);
}

void CastorRenderer::StateURL(const QString &URL)
{
    PublishState(CastorProtocol::SetStateURL, QVariantList() << URL);
}

/*! \class NullRenderer
 *  \brief A renderer that plays nothing.
 *
 * NullRenderer accepts every media command, logs it and reports the resulting state back to
 * the protocol as if a player had acted on it.
*/
class NullRenderer : public CastorRenderer
{
  public:
    explicit NullRenderer(CastorEventBus *Bus)
      : CastorRenderer("NullRenderer", Bus)
    {
    }

    Capabilities GetCapabilities(void)
    {
        return SetMediaStop | SetMediaPause | SetMediaResume | SetMediaVolume | SetMediaMute |
               SetMediaURL | SetMediaTitle | SetMediaPosition | SetMediaSubFile | SetMediaSubShow |
               SetMediaText | SetMediaSpeed;
    }

  protected:
    void MediaStop(void)
    {
        LOG(VB_MEDIA, LOG_INFO, "Stop");
        StateStop();
    }

    void MediaPause(void)
    {
        LOG(VB_MEDIA, LOG_INFO, "Pause");
        StatePause();
    }

    void MediaResume(void)
    {
        LOG(VB_MEDIA, LOG_INFO, "Resume");
        StatePlay();
    }

    void MediaVolume(int Volume)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Volume %1").arg(Volume));
        StateVolume(Volume);
    }

    void MediaMute(bool Mute)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Mute %1").arg(Mute));
        StateMute(Mute);
    }

    void MediaURL(const QString &URL, const QString &Title)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Play '%1' (%2)").arg(URL).arg(Title));
        StateURL(URL);
        StatePosition("00:00:00");
        StatePlay();
    }

    void MediaTitle(const QString &Title)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Title '%1'").arg(Title));
    }

    void MediaPosition(const QString &Position)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Seek %1").arg(Position));
        StatePosition(Position);
    }

    void MediaSubFile(const QString &File)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Subtitle file '%1'").arg(File));
    }

    void MediaSubShow(bool Show)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Subtitles %1").arg(Show ? "on" : "off"));
        StateSubtitle(Show);
    }

    void MediaText(const QString &Text, int Duration)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Text '%1' (%2ms)").arg(Text).arg(Duration));
    }

    void MediaSpeed(double Speed)
    {
        LOG(VB_MEDIA, LOG_INFO, QString("Speed %1").arg(Speed));
        StateSpeed(QString::number(Speed));
    }
};

class NullRendererFactory : public CastorRendererFactory
{
    QString Name(void)
    {
        return "NullRenderer";
    }

    CastorRenderer* Create(CastorEventBus *Bus)
    {
        return new NullRenderer(Bus);
    }
} NullRendererFactory;

/*! \class CastorRendererFactory
 *
 *  \sa CastorRenderer
*/
CastorRendererFactory* CastorRendererFactory::gCastorRendererFactory = NULL;

CastorRendererFactory::CastorRendererFactory()
{
    nextCastorRendererFactory = gCastorRendererFactory;
    gCastorRendererFactory = this;
}

CastorRendererFactory::~CastorRendererFactory()
{
}

CastorRendererFactory* CastorRendererFactory::GetCastorRendererFactory(void)
{
    return gCastorRendererFactory;
}

CastorRendererFactory* CastorRendererFactory::GetFactory(const QString &Name)
{
    CastorRendererFactory* factory = gCastorRendererFactory;
    for ( ; factory; factory = factory->NextFactory())
        if (factory->Name() == Name)
            return factory;
    return NULL;
}

CastorRendererFactory* CastorRendererFactory::NextFactory(void) const
{
    return nextCastorRendererFactory;
}
