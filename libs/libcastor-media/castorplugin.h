#ifndef CASTORPLUGIN_H
#define CASTORPLUGIN_H

// Qt
#include <QList>
#include <QStringList>

// Castor
#include "castormediaexport.h"

class CastorLibrary;
class CastorEventBus;
class CastorRenderer;
class CastorProtocol;

typedef bool (* CASTOR_LOAD_PLUGIN)   (const char*);
typedef bool (* CASTOR_UNLOAD_PLUGIN) (void);

class CASTOR_MEDIA_PUBLIC CastorPluginDescriptor
{
  public:
    enum Kind
    {
        Unknown  = 0,
        Renderer,
        Protocol
    };

    static bool    Parse             (const QString &Path, const QByteArray &Data, CastorPluginDescriptor &Descriptor);
    static QString CurrentPlatform   (void);

  public:
    CastorPluginDescriptor();
    CastorPluginDescriptor(Kind PluginKind, const QString &Factory);

    bool           IsValid           (void) const;
    bool           SupportsPlatform  (const QString &Platform) const;

    QString        m_path;
    QString        m_title;
    Kind           m_kind;
    QString        m_factory;
    QStringList    m_platforms;
    QString        m_version;
    QString        m_author;
    QString        m_description;
    bool           m_default;
};

class CASTOR_MEDIA_PUBLIC CastorPlugin
{
  public:
    explicit CastorPlugin(const QString &Directory = QString());
    ~CastorPlugin();

    QList<CastorPluginDescriptor> GetRenderers    (void);
    QList<CastorPluginDescriptor> GetProtocols    (void);
    CastorPluginDescriptor        FindRenderer    (const QString &Title);
    CastorPluginDescriptor        FindProtocol    (const QString &Title);
    CastorRenderer*               CreateRenderer  (const CastorPluginDescriptor &Descriptor, CastorEventBus *Bus);
    CastorProtocol*               CreateProtocol  (const CastorPluginDescriptor &Descriptor, CastorEventBus *Bus);
    bool                          AddDescriptor   (const CastorPluginDescriptor &Descriptor);

  private:
    void                          LoadLibraries   (const QString &Directory);
    void                          LoadDescriptors (const QString &Directory);
    CastorPluginDescriptor        Find            (const QList<CastorPluginDescriptor> &List, const QString &Title);

  private:
    QList<CastorLibrary*>         m_loadedPlugins;
    QList<CastorPluginDescriptor> m_renderers;
    QList<CastorPluginDescriptor> m_protocols;
};

#endif // CASTORPLUGIN_H
