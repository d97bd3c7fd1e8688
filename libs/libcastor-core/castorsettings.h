#ifndef CASTORSETTINGS_H
#define CASTORSETTINGS_H

// Qt
#include <QMap>
#include <QString>

// Castor
#include "castorcoreexport.h"
#include "castornetwork.h"

class QMutex;
class QReadWriteLock;

class CASTOR_CORE_PUBLIC CastorSettings
{
  public:
    CastorSettings();
    virtual ~CastorSettings();

    QString             GetSetting      (const QString &Name, const QString &DefaultValue);
    bool                GetSetting      (const QString &Name, const bool    &DefaultValue);
    int                 GetSetting      (const QString &Name, const int     &DefaultValue);
    void                SetSetting      (const QString &Name, const QString &Value);
    void                SetSetting      (const QString &Name, const bool    &Value);
    void                SetSetting      (const QString &Name, const int     &Value);

    CastorInterfaceList GetIP           (void);
    bool                IsIPChanged     (void);
    int                 GetPort         (void);
    QString             GetUSN          (bool Refresh = false);
    QString             GetServerInfo   (void);
    QString             GetFriendlyName (void);
    void                SetTemporaryFriendlyName (const QString &Name);

    static QString      GetSystem       (void);
    static QString      GetSystemVersion(void);
    static QString      CreateUUID      (void);

  protected:
    virtual CastorInterfaceList ReadInterfaces (void);

  private:
    QMap<QString,QString> m_settings;
    QReadWriteLock       *m_settingsLock;
    QMutex               *m_ipLock;
    CastorInterfaceList   m_lastIP;
    QString               m_temporaryFriendlyName;
};

#endif // CASTORSETTINGS_H
