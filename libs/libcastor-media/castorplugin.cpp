/* Class CastorPlugin
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
#include <QDir>
#include <QFile>
#include <QRegExp>
#include <QDirIterator>

// Castor
#include "castorversion.h"
#include "castorlogging.h"
#include "castorlibrary.h"
#include "castorrenderer.h"
#include "castorprotocol.h"
#include "castorplugin.h"

/*! \class CastorPluginDescriptor
 *  \brief Describes a renderer or protocol that can be selected at startup.
 *
 * Descriptors are read from '.castor' files, which start with a block of comment lines
 * containing metadata tags:
 *
 * \code
 * # <castor.title>Null Renderer</castor.title>
 * # <castor.renderer>NullRenderer</castor.renderer>
 * # <castor.platform>linux,darwin</castor.platform>
 * # <castor.version>1.0</castor.version>
 * # <castor.author>Castor</castor.author>
 * # <castor.desc>Logs media commands</castor.desc>
 * \endcode
 *
 * castor.renderer or castor.protocol names the registered factory that creates the
 * implementation. A descriptor with no platform tag supports every platform.
*/
CastorPluginDescriptor::CastorPluginDescriptor()
  : m_kind(Unknown),
    m_default(false)
{
}

///\brief Create a built in descriptor for Factory.
CastorPluginDescriptor::CastorPluginDescriptor(Kind PluginKind, const QString &Factory)
  : m_title(Factory),
    m_kind(PluginKind),
    m_factory(Factory),
    m_default(true)
{
}

bool CastorPluginDescriptor::IsValid(void) const
{
    return m_kind != Unknown && !m_factory.isEmpty();
}

bool CastorPluginDescriptor::SupportsPlatform(const QString &Platform) const
{
    return m_platforms.isEmpty() || m_platforms.contains(Platform);
}

QString CastorPluginDescriptor::CurrentPlatform(void)
{
#if defined(Q_OS_WIN)
    return "win32";
#elif defined(Q_OS_MAC)
    return "darwin";
#else
    return "linux";
#endif
}

/*! \brief Read the metadata header in Data.
 *
 * Only the leading comment lines ('#' or '//') are examined. Returns false if the header does
 * not name a renderer or protocol factory.
*/
bool CastorPluginDescriptor::Parse(const QString &Path, const QByteArray &Data, CastorPluginDescriptor &Descriptor)
{
    CastorPluginDescriptor result;
    result.m_path = Path;

    QRegExp tag("<castor\\.([a-z_]+)>(.*)</castor\\.\\1>");
    tag.setMinimal(true);

    QStringList lines = QString::fromUtf8(Data).split('\n');
    foreach (const QString &line, lines)
    {
        QString comment = line.trimmed();
        if (comment.isEmpty())
            continue;

        if (comment.startsWith('#'))
            comment = comment.mid(1);
        else if (comment.startsWith("//"))
            comment = comment.mid(2);
        else
            break;

        int position = 0;
        while ((position = tag.indexIn(comment, position)) > -1)
        {
            QString name  = tag.cap(1);
            QString value = tag.cap(2).trimmed();
            position += tag.matchedLength();

            if (name == "title")
            {
                result.m_title = value;
            }
            else if (name == "renderer")
            {
                result.m_kind    = Renderer;
                result.m_factory = value;
            }
            else if (name == "protocol")
            {
                result.m_kind    = Protocol;
                result.m_factory = value;
            }
            else if (name == "platform")
            {
                QStringList platforms = value.split(',', QString::SkipEmptyParts);
                foreach (const QString &platform, platforms)
                    result.m_platforms << platform.trimmed().toLower();
            }
            else if (name == "version")
            {
                result.m_version = value;
            }
            else if (name == "author")
            {
                result.m_author = value;
            }
            else if (name == "desc")
            {
                result.m_description = value;
            }
            else
            {
                LOG(VB_PLUGIN, LOG_DEBUG, QString("Ignoring unknown tag '%1' in '%2'").arg(name).arg(Path));
            }
        }
    }

    if (!result.IsValid())
        return false;

    if (result.m_title.isEmpty())
        result.m_title = result.m_factory;

    Descriptor = result;
    return true;
}

/*! \class CastorPlugin
 *  \brief Loads renderer and protocol plugins at startup.
 *
 * CastorPlugin searches the plugin directory (CASTOR_PLUGIN_PATH by default) and any directory
 * named by CASTOR_RUNTIME_LIBS. Libraries prefixed with 'libcastor' are loaded first, which
 * registers their renderer and protocol factories, and must export LoadPlugin and UnloadPlugin.
 * '.castor' descriptor files are then read and matched against the registered factories.
 *
 * The built in NullRenderer and DefaultProtocol are always available and are used when no
 * other implementation is selected.
 *
 * \note Symbolic links are not followed.
*/
CastorPlugin::CastorPlugin(const QString &Directory)
{
    m_renderers.append(CastorPluginDescriptor(CastorPluginDescriptor::Renderer, "NullRenderer"));
    m_protocols.append(CastorPluginDescriptor(CastorPluginDescriptor::Protocol, "DefaultProtocol"));

    QStringList directories;
    directories << (Directory.isEmpty() ? QString(CASTOR_PLUGIN_PATH) : Directory);

    QString fallback = qgetenv("CASTOR_RUNTIME_LIBS");
    if (!fallback.isEmpty() && !directories.contains(fallback))
        directories << fallback;

    foreach (const QString &directory, directories)
        LoadLibraries(directory);

    foreach (const QString &directory, directories)
        LoadDescriptors(directory);

    LOG(VB_PLUGIN, LOG_INFO, QString("%1 renderers and %2 protocols available").arg(m_renderers.size()).arg(m_protocols.size()));
}

///brief Unload previously loaded plugins
CastorPlugin::~CastorPlugin()
{
    while (!m_loadedPlugins.isEmpty())
    {
        CastorLibrary* library = m_loadedPlugins.takeLast();
        if (library->isLoaded())
        {
            CASTOR_UNLOAD_PLUGIN unload = (CASTOR_UNLOAD_PLUGIN)library->resolve("UnloadPlugin");
            if (unload)
                if (!unload())
                    LOG(VB_PLUGIN, LOG_INFO, QString("UnloadPlugin call failed for '%1'").arg(library->fileName()));

            if (!library->unload())
                LOG(VB_PLUGIN, LOG_WARNING, QString("Failed to unload plugin '%1'").arg(library->fileName()));
        }
        delete library;
    }
}

QList<CastorPluginDescriptor> CastorPlugin::GetRenderers(void)
{
    return m_renderers;
}

QList<CastorPluginDescriptor> CastorPlugin::GetProtocols(void)
{
    return m_protocols;
}

CastorPluginDescriptor CastorPlugin::FindRenderer(const QString &Title)
{
    return Find(m_renderers, Title);
}

CastorPluginDescriptor CastorPlugin::FindProtocol(const QString &Title)
{
    return Find(m_protocols, Title);
}

CastorRenderer* CastorPlugin::CreateRenderer(const CastorPluginDescriptor &Descriptor, CastorEventBus *Bus)
{
    CastorRendererFactory *factory = CastorRendererFactory::GetFactory(Descriptor.m_factory);
    if (!factory)
    {
        LOG(VB_PLUGIN, LOG_ERR, QString("No renderer factory named '%1'").arg(Descriptor.m_factory));
        return NULL;
    }

    return factory->Create(Bus);
}

CastorProtocol* CastorPlugin::CreateProtocol(const CastorPluginDescriptor &Descriptor, CastorEventBus *Bus)
{
    CastorProtocolFactory *factory = CastorProtocolFactory::GetFactory(Descriptor.m_factory);
    if (!factory)
    {
        LOG(VB_PLUGIN, LOG_ERR, QString("No protocol factory named '%1'").arg(Descriptor.m_factory));
        return NULL;
    }

    return factory->Create(Bus);
}

/*! \brief Add Descriptor to the list of available plugins.
 *
 * Descriptors for another platform, or naming a factory that has not been registered, are
 * rejected.
*/
bool CastorPlugin::AddDescriptor(const CastorPluginDescriptor &Descriptor)
{
    if (!Descriptor.IsValid())
        return false;

    if (!Descriptor.SupportsPlatform(CastorPluginDescriptor::CurrentPlatform()))
    {
        LOG(VB_PLUGIN, LOG_INFO, QString("'%1' is not supported on %2").arg(Descriptor.m_title).arg(CastorPluginDescriptor::CurrentPlatform()));
        return false;
    }

    bool known = Descriptor.m_kind == CastorPluginDescriptor::Renderer ?
                     CastorRendererFactory::GetFactory(Descriptor.m_factory) != NULL :
                     CastorProtocolFactory::GetFactory(Descriptor.m_factory) != NULL;
    if (!known)
    {
        LOG(VB_PLUGIN, LOG_WARNING, QString("'%1' names unknown factory '%2'").arg(Descriptor.m_title).arg(Descriptor.m_factory));
        return false;
    }

    if (Descriptor.m_kind == CastorPluginDescriptor::Renderer)
        m_renderers.append(Descriptor);
    else
        m_protocols.append(Descriptor);

    LOG(VB_PLUGIN, LOG_INFO, QString("Added %1 '%2' (%3)")
        .arg(Descriptor.m_kind == CastorPluginDescriptor::Renderer ? "renderer" : "protocol")
        .arg(Descriptor.m_title).arg(Descriptor.m_path));
    return true;
}

///brief Search the given directory for castor libraries and attempt to load and initialise them.
void CastorPlugin::LoadLibraries(const QString &Directory)
{
    QStringList filter;
    filter.append("libcastor*");

    QDirIterator it(Directory, filter, QDir::NoDotAndDotDot | QDir::Files | QDir::Readable | QDir::Executable | QDir::NoSymLinks);

    if (!it.hasNext())
    {
        LOG(VB_PLUGIN, LOG_INFO, QString("No plugins found in '%1'").arg(Directory));
        return;
    }

    while (it.hasNext())
    {
        it.next();
        CastorLibrary* library = new CastorLibrary(it.filePath());

        CASTOR_LOAD_PLUGIN     loadplugin = (CASTOR_LOAD_PLUGIN)library->resolve("LoadPlugin");
        CASTOR_UNLOAD_PLUGIN unloadplugin = (CASTOR_UNLOAD_PLUGIN)library->resolve("UnloadPlugin");
        bool unload = false;

        if (!unloadplugin)
        {
            LOG(VB_PLUGIN, LOG_ERR, QString("Plugin '%1' does not implement UnloadPlugin").arg(library->fileName()));
            unload = true;
        }
        else if (!loadplugin)
        {
            LOG(VB_PLUGIN, LOG_ERR, QString("Plugin '%1' does not implement LoadPlugin").arg(library->fileName()));
            unload = true;
        }
        else if (!loadplugin(QT_VERSION_STR))
        {
            LOG(VB_PLUGIN, LOG_INFO, QString("Plugin '%1' initialisation failed. Disabling").arg(library->fileName()));
            unload = true;
        }

        if (unload)
        {
            if (library->isLoaded() && !library->unload())
                LOG(VB_PLUGIN, LOG_ERR, QString("Failed to unload '%1'").arg(it.fileName()));
            delete library;
        }
        else
        {
            m_loadedPlugins.append(library);
        }
    }
}

void CastorPlugin::LoadDescriptors(const QString &Directory)
{
    QStringList filter;
    filter.append("*.castor");

    QDirIterator it(Directory, filter, QDir::NoDotAndDotDot | QDir::Files | QDir::Readable | QDir::NoSymLinks);
    while (it.hasNext())
    {
        it.next();

        QFile file(it.filePath());
        if (!file.open(QIODevice::ReadOnly))
        {
            LOG(VB_PLUGIN, LOG_WARNING, QString("Failed to open '%1' (%2)").arg(it.filePath()).arg(file.errorString()));
            continue;
        }

        CastorPluginDescriptor descriptor;
        if (CastorPluginDescriptor::Parse(it.filePath(), file.readAll(), descriptor))
            (void)AddDescriptor(descriptor);
        else
            LOG(VB_PLUGIN, LOG_WARNING, QString("'%1' is not a valid plugin descriptor").arg(it.filePath()));
        file.close();
    }
}

///\brief Return the descriptor titled Title, or the built in default.
CastorPluginDescriptor CastorPlugin::Find(const QList<CastorPluginDescriptor> &List, const QString &Title)
{
    CastorPluginDescriptor fallback;

    QList<CastorPluginDescriptor>::const_iterator it = List.constBegin();
    for ( ; it != List.constEnd(); ++it)
    {
        if (!Title.isEmpty() && ((*it).m_title == Title || (*it).m_factory == Title))
            return *it;
        if ((*it).m_default && !fallback.IsValid())
            fallback = *it;
    }

    if (!Title.isEmpty())
        LOG(VB_PLUGIN, LOG_WARNING, QString("No plugin named '%1' - using '%2'").arg(Title).arg(fallback.m_title));
    return fallback;
}
