#ifndef CASTORTESTHELPERS_H
#define CASTORTESTHELPERS_H

// Qt
#include <QMap>
#include <QList>
#include <QMutex>
#include <QWaitCondition>

// Castor
#include "castorsettings.h"
#include "castoreventbus.h"
#include "upnp/castorssdpsocketset.h"

class SentDatagram
{
  public:
    QByteArray   m_datagram;
    QHostAddress m_host;
    quint16      m_port;
    QString      m_interface;
};

// An in memory socket set. Nothing touches the network.
class FakeSSDPSocketSet : public CastorSSDPSocketSet
{
  public:
    FakeSSDPSocketSet()
      : CastorSSDPSocketSet(),
        m_open(false),
        m_bindError(false),
        m_interrupted(false),
        m_opened(0)
    {
    }

    Error Open(const CastorInterfaceList &Interfaces)
    {
        QMutexLocker locker(&m_lock);
        if (m_bindError)
            return BindError;

        m_open        = true;
        m_interrupted = false;
        m_interfaces  = Interfaces;
        m_opened++;
        return NoError;
    }

    void Close(void)
    {
        QMutexLocker locker(&m_lock);
        m_open = false;
        m_interfaces.clear();
    }

    bool IsOpen(void)
    {
        QMutexLocker locker(&m_lock);
        return m_open;
    }

    CastorInterfaceList GetInterfaces(void)
    {
        QMutexLocker locker(&m_lock);
        return m_interfaces;
    }

    qint64 Receive(QByteArray &Datagram, QHostAddress &Host, quint16 &Port, int TimeoutMS)
    {
        QMutexLocker locker(&m_lock);

        if (m_incoming.isEmpty() && !m_interrupted)
            m_condition.wait(&m_lock, TimeoutMS);

        if (m_interrupted)
        {
            m_interrupted = false;
            Datagram.clear();
            Host = QHostAddress(QHostAddress::LocalHost);
            Port = 1900;
            return 0;
        }

        if (m_incoming.isEmpty())
            return -1;

        SentDatagram incoming = m_incoming.takeFirst();
        Datagram = incoming.m_datagram;
        Host     = incoming.m_host;
        Port     = incoming.m_port;
        return Datagram.size();
    }

    bool SendResponse(const QByteArray &Datagram, const QHostAddress &Host, quint16 Port)
    {
        QMutexLocker locker(&m_lock);
        SentDatagram sent;
        sent.m_datagram = Datagram;
        sent.m_host     = Host;
        sent.m_port     = Port;
        m_responses.append(sent);
        return true;
    }

    bool SendMulticast(const QByteArray &Datagram, const QString &Interface)
    {
        QMutexLocker locker(&m_lock);
        SentDatagram sent;
        sent.m_datagram  = Datagram;
        sent.m_port      = 1900;
        sent.m_interface = Interface;
        m_multicasts.append(sent);
        return true;
    }

    void Interrupt(void)
    {
        QMutexLocker locker(&m_lock);
        m_interrupted = true;
        m_condition.wakeAll();
    }

    void Inject(const QByteArray &Datagram, const QHostAddress &Host, quint16 Port)
    {
        QMutexLocker locker(&m_lock);
        SentDatagram incoming;
        incoming.m_datagram = Datagram;
        incoming.m_host     = Host;
        incoming.m_port     = Port;
        m_incoming.append(incoming);
        m_condition.wakeAll();
    }

    void SetInterfaces(const CastorInterfaceList &Interfaces)
    {
        QMutexLocker locker(&m_lock);
        m_interfaces = Interfaces;
    }

    void SetBindError(bool BindFails)
    {
        QMutexLocker locker(&m_lock);
        m_bindError = BindFails;
    }

    QList<SentDatagram> Responses(void)
    {
        QMutexLocker locker(&m_lock);
        return m_responses;
    }

    QList<SentDatagram> Multicasts(void)
    {
        QMutexLocker locker(&m_lock);
        return m_multicasts;
    }

    int CountMulticasts(const QByteArray &Match)
    {
        QMutexLocker locker(&m_lock);
        int result = 0;
        foreach (const SentDatagram &sent, m_multicasts)
            if (sent.m_datagram.contains(Match))
                result++;
        return result;
    }

    int OpenCount(void)
    {
        QMutexLocker locker(&m_lock);
        return m_opened;
    }

    void ClearSent(void)
    {
        QMutexLocker locker(&m_lock);
        m_responses.clear();
        m_multicasts.clear();
    }

  private:
    QMutex              m_lock;
    QWaitCondition      m_condition;
    bool                m_open;
    bool                m_bindError;
    bool                m_interrupted;
    int                 m_opened;
    CastorInterfaceList m_interfaces;
    QList<SentDatagram> m_incoming;
    QList<SentDatagram> m_responses;
    QList<SentDatagram> m_multicasts;
};

// Settings with a fixed, changeable interface list.
class StaticSettings : public CastorSettings
{
  public:
    StaticSettings()
      : CastorSettings()
    {
        m_interfaces << CastorInterface("192.168.1.10", "255.255.255.0");
    }

    void SetInterfaces(const CastorInterfaceList &Interfaces)
    {
        QMutexLocker locker(&m_lock);
        m_interfaces = Interfaces;
    }

  protected:
    CastorInterfaceList ReadInterfaces(void)
    {
        QMutexLocker locker(&m_lock);
        return m_interfaces;
    }

  private:
    QMutex              m_lock;
    CastorInterfaceList m_interfaces;
};

// Counts published topics and returns a fixed value.
class CountingHandler : public CastorEventHandler
{
  public:
    explicit CountingHandler(const QVariant &Result = QVariant())
      : m_result(Result)
    {
    }

    QVariant HandleEvent(const QString &Topic, const QVariantList &Arguments)
    {
        QMutexLocker locker(&m_lock);
        m_counts[Topic]++;
        m_arguments = Arguments;
        return m_result;
    }

    int Count(const QString &Topic)
    {
        QMutexLocker locker(&m_lock);
        return m_counts.value(Topic, 0);
    }

    QVariantList LastArguments(void)
    {
        QMutexLocker locker(&m_lock);
        return m_arguments;
    }

  private:
    QMutex             m_lock;
    QVariant           m_result;
    QMap<QString,int>  m_counts;
    QVariantList       m_arguments;
};

#endif // CASTORTESTHELPERS_H
