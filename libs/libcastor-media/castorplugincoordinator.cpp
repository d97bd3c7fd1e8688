/* Class CastorPluginCoordinator
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

// Castor
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castorplugincoordinator.h"

/*! \class CastorPluginCoordinator
 *  \brief Base class for the objects that own the active renderer and protocol.
 *
 * A coordinator subscribes the capabilities of its implementation, plus its control topics,
 * to the event bus while running. Event dispatch and replacement of the implementation
 * share one lock, so a dispatch never sees a partially swapped implementation.
*/
CastorPluginCoordinator::CastorPluginCoordinator(const QString &Name, CastorEventBus *Bus)
  : QObject(),
    CastorEventHandler(),
    m_name(Name),
    m_bus(Bus),
    m_lock(new QMutex(QMutex::Recursive)),
    m_running(false)
{
}

CastorPluginCoordinator::~CastorPluginCoordinator()
{
    delete m_lock;
}

bool CastorPluginCoordinator::IsRunning(void)
{
    QMutexLocker locker(m_lock);
    return m_running;
}

QStringList CastorPluginCoordinator::GetTopics(void)
{
    QMutexLocker locker(m_lock);
    return m_topics;
}

void CastorPluginCoordinator::SubscribeTopics(const QStringList &Topics)
{
    m_topics = Topics;
    foreach (const QString &topic, m_topics)
        m_bus->Subscribe(topic, this);
    LOG(VB_PLUGIN, LOG_DEBUG, QString("%1 subscribed to: %2").arg(m_name).arg(m_topics.join(",")));
}

void CastorPluginCoordinator::UnsubscribeTopics(void)
{
    foreach (const QString &topic, m_topics)
        m_bus->Unsubscribe(topic, this);
    m_topics.clear();
}

/*! \class CastorRendererPlugin
 *  \brief Owns the active renderer.
 *
 * Handles 'reload_renderer', 'get_renderer' and 'set_renderer' plus every 'set_media_*'
 * topic the renderer supports. These topics are only subscribed while the coordinator is running.
 *
 * 'set_renderer' takes ownership of the new renderer whenever it returns a result. If Publish
 * returns no result (no coordinator is running) the publisher still owns the renderer and must
 * delete it.
*/
CastorRendererPlugin::CastorRendererPlugin(CastorEventBus *Bus, CastorRenderer *Renderer)
  : CastorPluginCoordinator("RendererPlugin", Bus),
    m_renderer(Renderer),
    m_capabilities(CastorRenderer::NoCapabilities)
{
}

CastorRendererPlugin::~CastorRendererPlugin()
{
    Stop();
    delete m_renderer;
}

///\brief Start the renderer and subscribe its capabilities.
bool CastorRendererPlugin::Start(void)
{
    QMutexLocker locker(m_lock);

    if (m_running)
        return true;

    if (!m_renderer)
    {
        LOG(VB_PLUGIN, LOG_ERR, "No renderer to start");
        return false;
    }

    LOG(VB_PLUGIN, LOG_INFO, QString("Starting renderer plugin (%1)").arg(m_renderer->GetName()));

    if (!m_renderer->Start())
    {
        LOG(VB_PLUGIN, LOG_ERR, QString("Failed to start renderer '%1'").arg(m_renderer->GetName()));
        return false;
    }

    m_capabilities = m_renderer->GetCapabilities();

    QStringList topics = CastorRenderer::CapabilityTopics(m_capabilities);
    topics << CASTOR_TOPIC_RELOAD_RENDERER << CASTOR_TOPIC_GET_RENDERER << CASTOR_TOPIC_SET_RENDERER;
    SubscribeTopics(topics);

    m_running = true;
    return true;
}

///\brief Unsubscribe and then stop the renderer.
void CastorRendererPlugin::Stop(void)
{
    QMutexLocker locker(m_lock);

    if (!m_running)
        return;

    LOG(VB_PLUGIN, LOG_INFO, QString("Stopping renderer plugin (%1)").arg(m_renderer->GetName()));

    UnsubscribeTopics();
    m_renderer->Stop();
    m_capabilities = CastorRenderer::NoCapabilities;
    m_running = false;
}

bool CastorRendererPlugin::Reload(void)
{
    QMutexLocker locker(m_lock);

    if (!m_renderer || !m_running)
        return false;
    return m_renderer->Reload();
}

/*! \brief Replace the active renderer with Renderer.
 *
 * A NULL Renderer is rejected and the current renderer is kept. Otherwise the old renderer is
 * stopped and deleted and, if the coordinator was running, Renderer is started. If it fails to
 * start, it is deleted, the coordinator is left with no renderer and Failed is emitted.
*/
bool CastorRendererPlugin::SetRenderer(CastorRenderer *Renderer)
{
    QMutexLocker locker(m_lock);

    if (!Renderer)
    {
        LOG(VB_PLUGIN, LOG_ERR, "Ignoring request to switch to an invalid renderer");
        return false;
    }

    if (Renderer == m_renderer)
        return true;

    bool wasrunning = m_running;
    Stop();

    LOG(VB_PLUGIN, LOG_INFO, QString("Switching renderer from '%1' to '%2'")
        .arg(m_renderer ? m_renderer->GetName() : "None").arg(Renderer ? Renderer->GetName() : "None"));

    delete m_renderer;
    m_renderer = Renderer;

    if (!wasrunning)
        return true;

    if (Start())
        return true;

    delete m_renderer;
    m_renderer = NULL;
    LOG(VB_PLUGIN, LOG_CRIT, "Failed to start new renderer");
    emit Failed("Failed to start renderer");
    return false;
}

CastorRenderer* CastorRendererPlugin::GetRenderer(void)
{
    QMutexLocker locker(m_lock);
    return m_renderer;
}

CastorRenderer::Capabilities CastorRendererPlugin::GetCapabilities(void)
{
    QMutexLocker locker(m_lock);
    return m_capabilities;
}

QVariant CastorRendererPlugin::HandleEvent(const QString &Topic, const QVariantList &Arguments)
{
    QMutexLocker locker(m_lock);

    if (Topic == CASTOR_TOPIC_GET_RENDERER)
        return QVariant::fromValue(m_renderer);

    if (Topic == CASTOR_TOPIC_SET_RENDERER)
        return QVariant(SetRenderer(Arguments.value(0).value<CastorRenderer*>()));

    if (Topic == CASTOR_TOPIC_RELOAD_RENDERER)
        return QVariant(Reload());

    CastorRenderer::Capability capability = CastorRenderer::TopicToCapability(Topic);
    if (m_running && m_renderer && capability != CastorRenderer::NoCapabilities && (m_capabilities & capability))
        return m_renderer->Invoke(capability, Arguments);

    return QVariant();
}

/*! \class CastorProtocolPlugin
 *  \brief Owns the active protocol.
 *
 * Handles 'reload_protocol', 'get_protocol' and 'set_protocol' plus every 'set_state_*'
 * topic the protocol supports. ProtocolChanged is emitted whenever the active protocol (and
 * hence its HTTP handler) changes or is reloaded.
 *
 * 'set_protocol' follows the same ownership rule as 'set_renderer'.
 *
 * \note The pointer returned by 'get_protocol' is only valid until the protocol is replaced.
 * Use the 'set_state_*' topics to update state from other threads.
*/
CastorProtocolPlugin::CastorProtocolPlugin(CastorEventBus *Bus, CastorProtocol *Protocol)
  : CastorPluginCoordinator("ProtocolPlugin", Bus),
    m_protocol(Protocol),
    m_capabilities(CastorProtocol::NoCapabilities)
{
}

CastorProtocolPlugin::~CastorProtocolPlugin()
{
    Stop();
    delete m_protocol;
}

bool CastorProtocolPlugin::Start(void)
{
    QMutexLocker locker(m_lock);

    if (m_running)
        return true;

    if (!m_protocol)
    {
        LOG(VB_PLUGIN, LOG_ERR, "No protocol to start");
        return false;
    }

    LOG(VB_PLUGIN, LOG_INFO, QString("Starting protocol plugin (%1)").arg(m_protocol->GetName()));

    if (!m_protocol->Start())
    {
        LOG(VB_PLUGIN, LOG_ERR, QString("Failed to start protocol '%1'").arg(m_protocol->GetName()));
        return false;
    }

    m_capabilities = m_protocol->GetCapabilities();

    QStringList topics = CastorProtocol::CapabilityTopics(m_capabilities);
    topics << CASTOR_TOPIC_RELOAD_PROTOCOL << CASTOR_TOPIC_GET_PROTOCOL << CASTOR_TOPIC_SET_PROTOCOL;
    SubscribeTopics(topics);

    m_running = true;
    return true;
}

void CastorProtocolPlugin::Stop(void)
{
    QMutexLocker locker(m_lock);

    if (!m_running)
        return;

    LOG(VB_PLUGIN, LOG_INFO, QString("Stopping protocol plugin (%1)").arg(m_protocol->GetName()));

    UnsubscribeTopics();
    m_protocol->Stop();
    m_capabilities = CastorProtocol::NoCapabilities;
    m_running = false;
}

bool CastorProtocolPlugin::Reload(void)
{
    QMutexLocker locker(m_lock);

    if (!m_protocol || !m_running)
        return false;

    bool result = m_protocol->Reload();
    emit ProtocolChanged(result ? m_protocol : NULL);
    return result;
}

///\brief Replace the active protocol with Protocol. Behaves as CastorRendererPlugin::SetRenderer.
bool CastorProtocolPlugin::SetProtocol(CastorProtocol *Protocol)
{
    QMutexLocker locker(m_lock);

    if (!Protocol)
    {
        LOG(VB_PLUGIN, LOG_ERR, "Ignoring request to switch to an invalid protocol");
        return false;
    }

    if (Protocol == m_protocol)
        return true;

    bool wasrunning = m_running;
    Stop();

    LOG(VB_PLUGIN, LOG_INFO, QString("Switching protocol from '%1' to '%2'")
        .arg(m_protocol ? m_protocol->GetName() : "None").arg(Protocol ? Protocol->GetName() : "None"));

    emit ProtocolChanged(NULL);
    delete m_protocol;
    m_protocol = Protocol;

    if (!wasrunning)
        return true;

    if (Start())
    {
        emit ProtocolChanged(m_protocol);
        return true;
    }

    delete m_protocol;
    m_protocol = NULL;
    LOG(VB_PLUGIN, LOG_CRIT, "Failed to start new protocol");
    emit Failed("Failed to start protocol");
    return false;
}

CastorProtocol* CastorProtocolPlugin::GetProtocol(void)
{
    QMutexLocker locker(m_lock);
    return m_protocol;
}

CastorProtocol::Capabilities CastorProtocolPlugin::GetCapabilities(void)
{
    QMutexLocker locker(m_lock);
    return m_capabilities;
}

QVariant CastorProtocolPlugin::HandleEvent(const QString &Topic, const QVariantList &Arguments)
{
    QMutexLocker locker(m_lock);

    if (Topic == CASTOR_TOPIC_GET_PROTOCOL)
        return QVariant::fromValue(m_protocol);

    if (Topic == CASTOR_TOPIC_SET_PROTOCOL)
        return QVariant(SetProtocol(Arguments.value(0).value<CastorProtocol*>()));

    if (Topic == CASTOR_TOPIC_RELOAD_PROTOCOL)
        return QVariant(Reload());

    CastorProtocol::Capability capability = CastorProtocol::TopicToCapability(Topic);
    if (m_running && m_protocol && capability != CastorProtocol::NoCapabilities && (m_capabilities & capability))
        return m_protocol->Invoke(capability, Arguments);

    return QVariant();
}
