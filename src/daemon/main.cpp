// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../core/logging.h"
#include "../core/unixsignalwatcher.h"
#include <QGuiApplication>
#include <QCommandLineParser>
#include <KAboutData>
#include <KLocalizedString>
#include <KDBusService>
#include <signal.h>

using namespace DropHint;

namespace {

KAboutData drophintAboutData()
{
    KAboutData aboutData(QStringLiteral("drophintd"), i18n("DropHint"), QStringLiteral("1.0.0"),
                         i18n("Shows where a dragged window will land when splitting the screen"),
                         KAboutLicense::GPL_V3, i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.drophint.daemon"));
    return aboutData;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    // Hints are drawn by the drag host, so there is never a window keeping us alive
    app.setQuitOnLastWindowClosed(false);

    KLocalizedString::setApplicationDomain("drophintd");

    KAboutData aboutData = drophintAboutData();
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                     i18n("Take over from a running drophintd"));
    parser.addOption(replaceOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    KDBusService::StartupOptions options = KDBusService::Unique;
    if (parser.isSet(replaceOption)) {
        options |= KDBusService::Replace;
    }
    KDBusService service(options);

    // SIGINT/SIGTERM/SIGHUP end the event loop; shutdown runs after exec() returns
    UnixSignalWatcher signalWatcher;
    for (int signum : {SIGINT, SIGTERM, SIGHUP}) {
        if (!signalWatcher.watch(signum)) {
            qCWarning(DropHint::lcDaemon) << "Signal" << signum << "will terminate without saving settings";
        }
    }
    QObject::connect(&signalWatcher, &UnixSignalWatcher::unixSignal, &app, [](int signum) {
        qCInfo(DropHint::lcDaemon) << "Received signal" << signum << "- shutting down";
        QCoreApplication::quit();
    });

    Daemon daemon;
    if (!daemon.init()) {
        qCCritical(DropHint::lcDaemon) << "Failed to initialize daemon";
        return 1;
    }

    daemon.start();
    qCInfo(DropHint::lcDaemon) << "Started successfully";

    QObject::connect(&service, &KDBusService::activateRequested, &daemon, []() {
        qCDebug(DropHint::lcDaemon) << "Already running - hints are driven over D-Bus, nothing to activate";
    });

    const int result = app.exec();
    daemon.stop();
    return result;
}
