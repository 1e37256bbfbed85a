#include <QCoreApplication>
#include <QDir>
#include <QGuiApplication>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

#include "sync/event_bus.hpp"

int main(int argc, char** argv) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);
    QCoreApplication::setOrganizationName("ladle");
    QCoreApplication::setOrganizationDomain("ladle.app");
    QCoreApplication::setApplicationName("ladle_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/ladle_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());
    QStandardPaths::setTestModeEnabled(true);
    ladle::sync::register_sync_meta_types();
    Catch::Session session;
    return session.run(argc, argv);
}
