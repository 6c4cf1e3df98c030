#include <QCoreApplication>

#include "cli/SnapfreezeCli.hpp"
#include "common/interruption.hpp"
#include "common/snapfreeze_version.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("snapfreeze"));
    QCoreApplication::setApplicationVersion(QStringLiteral(SNAPFREEZE_VERSION));

    // Installed before anything can be frozen; recovery runs on the main stack.
    snapfreeze::interruption::install();

    snapfreeze::SnapfreezeCli cli;
    const int code = cli.run(QCoreApplication::arguments());

    snapfreeze::interruption::uninstall();
    return code;
}
