#include <QApplication>
#include <QStyleFactory>

#include "JobRunner.h"
#include "Logging.h"
#include "MainWindow.h"

int main(int argc, char* argv[]) {
    installMessagePattern();

    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("silencecut"));
    QApplication::setStyle(QStyleFactory::create(QStringLiteral("Fusion")));

    // ProcessingJob crosses from the UI thread to the worker through a
    // queued connection.
    qRegisterMetaType<ProcessingJob>("ProcessingJob");

    MainWindow window;
    window.show();
    return app.exec();
}
