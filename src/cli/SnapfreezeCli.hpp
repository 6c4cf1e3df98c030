#pragma once

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace snapfreeze {

struct RunConfig {
    std::string description;
    std::vector<Tag> tags;
    QString format = QStringLiteral("text");
    QString awsCli = QStringLiteral("aws");
    QString metadataUrl = QStringLiteral("http://169.254.169.254");
    std::chrono::milliseconds commandTimeout{60000};
    QString lockFile;
    QString mountTable;
    bool trace = false;
    bool showHelp = false;
    bool showVersion = false;
    QString helpText;
};

class SnapfreezeCli
{
public:
    // Parses arguments, takes the run lock and drives one snapshot run.
    // returns exit code
    int run(const QStringList &arguments);

    // CLI options with SNAPFREEZE_* environment fallbacks. Throws ConfigError.
    static RunConfig parseConfig(const QStringList &arguments);

    static void renderText(const RunReport &report, std::ostream &out);
    static void renderJson(const RunReport &report, std::ostream &out);

    // Failure summary for stderr: the triggering error plus every snapshot outcome.
    static void renderDiagnostics(const RunReport &report, std::ostream &err);
};

} // namespace snapfreeze
