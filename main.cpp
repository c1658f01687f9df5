#include <iostream>

#include <QApplication>
#include <QCommandLineParser>

#include "ui.hpp"


int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("ptg2d_viewer"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Planar triangulated graph visualizer"));
    parser.addHelpOption();
    QCommandLineOption seedOption(
        QStringList() << QStringLiteral("s") << QStringLiteral("seed"),
        QStringLiteral("Seed for random colours and random insertions."),
        QStringLiteral("seed"),
        QStringLiteral("5489"));
    parser.addOption(seedOption);
    QCommandLineOption quietOption(
        QStringList() << QStringLiteral("q") << QStringLiteral("quiet"),
        QStringLiteral("Do not log graph operations to stdout."));
    parser.addOption(quietOption);
    parser.process(app);

    bool isSeedValid = false;
    const unsigned int seed = parser.value(seedOption).toUInt(&isSeedValid);
    if (!isSeedValid)
    {
        std::cerr << "invalid seed: " << parser.value(seedOption).toStdString() << std::endl;
        return 1;
    }

    MainWindow window(seed, !parser.isSet(quietOption));
    window.show();
    return app.exec();
}
