#include <QApplication>
#include <QCoreApplication>
#include <QString>

#include "version.h"

#include "planner/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Quadrant Planner"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("quadrant-planner.org"));
    QCoreApplication::setApplicationName(QStringLiteral("Quadrant Planner"));

    QApplication app(argc, argv);

    planner::ui::MainWindow mainWindow;
    mainWindow.setWindowTitle(QObject::tr("Quadrant Planner %1").arg(QString::fromLatin1(kPlannerVersion)));
    mainWindow.show();

    return app.exec();
}
