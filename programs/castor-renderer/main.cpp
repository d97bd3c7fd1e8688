// Std
#include <signal.h>
#include <stdio.h>

// Qt
#include <QCoreApplication>
#include <QDateTime>
#include <QThread>
#include <QTime>

// Castor
#include "castorversion.h"
#include "castorlocaldefs.h"
#include "castorexitcodes.h"
#include "castorlogging.h"
#include "castorcommandline.h"
#include "castorcoreutils.h"
#include "castorqthread.h"
#include "castorsettings.h"
#include "castoreventbus.h"
#include "castorplugin.h"
#include "castorrenderer.h"
#include "castorprotocol.h"
#include "castorservice.h"

static void ExitHandler(int Sig)
{
    signal(SIGINT, SIG_DFL);
    LOG(VB_GENERAL, LOG_INFO, QString("Received %1")
        .arg(Sig == SIGINT ? "SIGINT" : "SIGTERM"));

    QMetaObject::invokeMethod(qApp, "quit", Qt::QueuedConnection);
}

int main(int argc, char **argv)
{
    new QCoreApplication(argc, argv);
    QCoreApplication::setApplicationName("castor-renderer");
    QCoreApplication::setApplicationVersion(CASTOR_SOURCE_VERSION);
    QThread::currentThread()->setObjectName(CASTOR_MAIN_THREAD);
    CastorQThread::SetMainThread();
    qsrand(QDateTime::currentDateTime().toTime_t() ^ QTime::currentTime().msec());

    int ret = GENERIC_EXIT_OK;

    CastorSettings settings;
    QString renderertitle;
    QString protocoltitle;
    QString plugindir;

    {
        bool justexit = false;
        QScopedPointer<CastorCommandLine> cmdline(new CastorCommandLine(CastorCommandLine::LogFile));

        cmdline->Add("p,port",   QVariant((int)0),       "Preferred HTTP port (0 for any port).");
        cmdline->Add("n,name",   QVariant(QString("")),  "Device name shown to control points.");
        cmdline->Add("b,block",  QVariant(QStringList()), "Comma separated list of network interfaces to ignore.");
        cmdline->Add("plugins",  QVariant(QString("")),  "Plugin directory.");
        cmdline->Add("renderer", QVariant(QString("")),  "Title of the renderer to use.");
        cmdline->Add("protocol", QVariant(QString("")),  "Title of the protocol to use.");

        ret = cmdline->Evaluate(argc, argv, justexit);

        if (ret != GENERIC_EXIT_OK)
            return ret;

        if (justexit)
            return ret;

        if (ParseVerboseArgument(cmdline->GetValue("v").toString()) != GENERIC_EXIT_OK)
            return GENERIC_EXIT_INVALID_CMDLINE;

        LogLevel level = GetLogLevel(cmdline->GetValue("l").toString());
        if (level == LOG_UNKNOWN)
        {
            fprintf(stderr, "Unknown log level '%s'\n", cmdline->GetValue("l").toString().toLocal8Bit().constData());
            return GENERIC_EXIT_INVALID_CMDLINE;
        }

        gVerboseMask |= VB_STDIO | VB_FLUSH;
        StartLogging(cmdline->GetValue("logfile").toString(), level);
        qInstallMessageHandler(&CastorCoreUtils::QtMessage);

        LOG(VB_GENERAL, LOG_CRIT, QString("%1 version: %2")
            .arg(QCoreApplication::applicationName()).arg(CASTOR_SOURCE_VERSION));
        LOG(VB_GENERAL, LOG_NOTICE, QString("Enabled verbose msgs: %1").arg(gVerboseString));

        settings.SetSetting(CASTOR_SETTING_PORT, cmdline->GetValue("port").toInt());

        QString name = cmdline->GetValue("name").toString();
        if (!name.isEmpty())
            settings.SetSetting(CASTOR_SETTING_NAME, name);

        QStringList blocked = cmdline->GetValue("block").toStringList();
        if (!blocked.isEmpty())
            settings.SetSetting(CASTOR_SETTING_BLOCKED, blocked.join(","));

        plugindir     = cmdline->GetValue("plugins").toString();
        renderertitle = cmdline->GetValue("renderer").toString();
        protocoltitle = cmdline->GetValue("protocol").toString();
    }

    signal(SIGINT,  ExitHandler);
    signal(SIGTERM, ExitHandler);

    {
        CastorEventBus bus;
        CastorPlugin plugins(plugindir);

        CastorRenderer *renderer = plugins.CreateRenderer(plugins.FindRenderer(renderertitle), &bus);
        CastorProtocol *protocol = plugins.CreateProtocol(plugins.FindProtocol(protocoltitle), &bus);

        CastorService service(&settings, &bus, renderer, protocol);
        ret = service.Start();
        if (ret == GENERIC_EXIT_OK)
        {
            ret = qApp->exec();
            service.Stop();
        }
    }

    LOG(VB_GENERAL, LOG_INFO, QString("Exiting with status %1").arg(ret));
    StopLogging();
    delete qApp;
    return ret;
}
