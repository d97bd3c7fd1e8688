#ifndef CASTORSSDPSCHEDULER_H
#define CASTORSSDPSCHEDULER_H

// Qt
#include <QObject>

// Castor
#include "castorcoreexport.h"
#include "castorqthread.h"

class CastorSettings;
class CastorEventBus;

#define CASTOR_SSDP_TICK_INTERVAL 3000
#define CASTOR_SSDP_UPDATE_TICKS  10

class CASTOR_CORE_PUBLIC CastorSSDPScheduler : public QObject
{
    Q_OBJECT

  public:
    CastorSSDPScheduler(CastorSettings *Settings, CastorEventBus *Bus);
    virtual ~CastorSSDPScheduler();

    void            StartTimer    (int Interval = CASTOR_SSDP_TICK_INTERVAL);
    void            StopTimer     (void);
    void            Tick          (void);
    int             GetCounter    (void) const;

  protected:
    void            timerEvent    (QTimerEvent *Event);

  private:
    CastorSettings *m_settings;
    CastorEventBus *m_bus;
    int             m_timer;
    int             m_counter;
};

class CASTOR_CORE_PUBLIC CastorSSDPSchedulerThread : public CastorQThread
{
  public:
    CastorSSDPSchedulerThread(CastorSettings *Settings, CastorEventBus *Bus);
    virtual ~CastorSSDPSchedulerThread();

    void                 Start (void);
    void                 Finish(void);

  private:
    CastorSettings      *m_settings;
    CastorEventBus      *m_bus;
    CastorSSDPScheduler *m_scheduler;
};

#endif // CASTORSSDPSCHEDULER_H
