// Qt
#include <QCoreApplication>
#include <QThread>

// Castor
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castorqthread.h"

#include <catch2/catch_session.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QThread::currentThread()->setObjectName(CASTOR_MAIN_THREAD);
    CastorQThread::SetMainThread();

    ParseVerboseArgument("none");
    StartLogging(QString(""), LOG_ERR);

    int result = Catch::Session().run(argc, argv);

    StopLogging();
    return result;
}
