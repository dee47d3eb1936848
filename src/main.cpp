#include <QApplication>
#include <QCoreApplication>
#include <QString>

#include "version.h"

#include "planner/interaction/DragSession.hpp"
#include "planner/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("BlockPlanner"));
    QCoreApplication::setApplicationName(QStringLiteral("Block Planner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kBlockPlannerVersion));

    QApplication app(argc, argv);
    qRegisterMetaType<planner::interaction::DragItem>();
    qRegisterMetaType<planner::interaction::DropPosition>();
    qRegisterMetaType<planner::interaction::DragDrop>();

    planner::ui::MainWindow mainWindow;
    mainWindow.setWindowTitle(QObject::tr("Block Planner %1").arg(QString::fromLatin1(kBlockPlannerVersion)));
    mainWindow.showMaximized();

    return app.exec();
}
