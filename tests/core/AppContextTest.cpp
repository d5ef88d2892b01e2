#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "planner/core/AppContext.hpp"
#include "planner/core/AppSettings.hpp"
#include "planner/data/DataProvider.hpp"
#include "planner/data/TaskStore.hpp"

using namespace planner;

namespace {
std::unique_ptr<core::AppSettings> settingsIn(const QTemporaryDir &dir)
{
    auto settings = std::make_unique<core::AppSettings>(dir.filePath(QStringLiteral("planner.ini")));
    settings->setWorkspaceFile(dir.filePath(QStringLiteral("tasks.md")));
    return settings;
}
} // namespace

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void settingsDefaults();
    void settingsPersist();
    void seedsWithoutWorkspaceFile();
    void savesOnShutdown();
    void skipsSaveWhenDisabled();
    void keepsUnreadableWorkspaceFile();
};

void AppContextTest::settingsDefaults()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    core::AppSettings settings(dir.filePath(QStringLiteral("defaults.ini")));

    QVERIFY(settings.saveOnExit());
    QVERIFY(!settings.hideCompleted());
    QCOMPARE(settings.workspaceFile(), core::AppSettings::defaultWorkspaceFile());
    QVERIFY(settings.workspaceFile().endsWith(QStringLiteral("tasks.md")));
    QVERIFY(!settings.lastExportDirectory().isEmpty());
}

void AppContextTest::settingsPersist()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString iniFile = dir.filePath(QStringLiteral("persist.ini"));
    {
        core::AppSettings settings(iniFile);
        settings.setHideCompleted(true);
        settings.setSaveOnExit(false);
        settings.setLastExportDirectory(dir.path());
    }
    core::AppSettings reloaded(iniFile);
    QVERIFY(reloaded.hideCompleted());
    QVERIFY(!reloaded.saveOnExit());
    QCOMPARE(reloaded.lastExportDirectory(), dir.path());
}

void AppContextTest::seedsWithoutWorkspaceFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    core::AppContext context(settingsIn(dir));
    QVERIFY(!context.taskStore().isEmpty());
    QVERIFY(!context.dataProvider().hasWorkspaceFile());
}

void AppContextTest::savesOnShutdown()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    {
        core::AppContext context(settingsIn(dir));
        context.taskStore().replace({});
        context.taskStore().add(QStringLiteral("Persist me"), true, false);
        QVERIFY(context.shutdown());
    }

    core::AppContext reopened(settingsIn(dir));
    QCOMPARE(reopened.taskStore().size(), std::size_t(1));
    QCOMPARE(reopened.taskStore().snapshot().front().title, QStringLiteral("Persist me"));
}

void AppContextTest::skipsSaveWhenDisabled()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto settings = settingsIn(dir);
    settings->setSaveOnExit(false);

    core::AppContext context(std::move(settings));
    QVERIFY(context.shutdown());
    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("tasks.md"))));
}

void AppContextTest::keepsUnreadableWorkspaceFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.md"));
    QByteArray binary("garbage");
    binary.append('\0');
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        QCOMPARE(file.write(binary), qint64(binary.size()));
    }

    core::AppContext context(settingsIn(dir));
    QVERIFY(context.taskStore().isEmpty());
    QVERIFY(!context.shutdown());

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), binary);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
