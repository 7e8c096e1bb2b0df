#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

#include <cstdio>

#include "columnbalancer.h"
#include "contentjson.h"
#include "layoutengine.h"
#include "layoutjson.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pageflow"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Paginate a measured document and print its pages as JSON"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("file"),
                                 QStringLiteral("Measured document (JSON fixture)"));

    QCommandLineOption indentOption(QStringLiteral("indent"),
                                    QStringLiteral("Pretty-print the JSON output"));
    QCommandLineOption noBalanceOption(QStringLiteral("no-balance"),
                                       QStringLiteral("Disable column balancing"));
    parser.addOption(indentOption);
    parser.addOption(noBalanceOption);
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        qWarning("pageflow: expected exactly one input file");
        parser.showHelp(2);
    }

    // Errors are reported by the loader
    const ContentJson::Result loaded = ContentJson::load(args.first());
    if (!loaded.valid)
        return 1;

    Balancing::Config config = Balancing::Config::fromJson(loaded.balancing);
    if (parser.isSet(noBalanceOption))
        config.enabled = false;

    Layout::Engine engine;
    engine.setBalancingConfig(config);
    const Layout::LayoutResult result = engine.layout(loaded.document);

    const QJsonDocument out(LayoutJson::resultToJson(result));
    QFile stdoutFile;
    if (!stdoutFile.open(stdout, QIODevice::WriteOnly)) {
        qWarning("pageflow: cannot write to standard output");
        return 1;
    }
    stdoutFile.write(out.toJson(parser.isSet(indentOption) ? QJsonDocument::Indented
                                                           : QJsonDocument::Compact));
    stdoutFile.write("\n");
    return 0;
}
