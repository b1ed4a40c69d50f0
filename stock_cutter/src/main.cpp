#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <stdexcept>
#include <utility>
#include "CuttingStockEnv.h"
#include "PackingPolicy.h"
#include "TrainingOptions.h"

namespace {

// One episode of decide / step / reportOutcome; returns the final step
EnvStep runEpisode(CuttingStockEnv& env, PackingPolicy& policy, EnvStep current)
{
    policy.beginEpisode();

    while (!current.terminated && !current.truncated) {
        PolicyDecision decision = policy.decide(current.observation, current.info);
        EnvStep next = env.step(decision.placement);
        policy.reportOutcome(next.observation, next.info, next.terminated);
        current = std::move(next);

        if (!decision.placement) break;
    }

    return current;
}

bool ensureParentDir(const QString& path)
{
    return QDir().mkpath(QFileInfo(path).absolutePath());
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("StockCutter");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("StockCutter");

    QCommandLineParser parser;
    parser.setApplicationDescription("Trains the cutting-stock placement policy on generated instances.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "JSON configuration file.", "file");
    QCommandLineOption episodesOption("episodes", "Number of training episodes.", "count");
    QCommandLineOption seedOption("seed", "Seed for both the policy and the environment.", "seed");
    QCommandLineOption checkpointOption("checkpoint", "Checkpoint path (extension added).", "path");
    QCommandLineOption resumeOption("resume", "Checkpoint to load before training.", "path");
    QCommandLineOption metricsOption("metrics", "Write per-episode results to this CSV file.", "file");
    QCommandLineOption quietOption("quiet", "Suppress per-update training output.");
    parser.addOptions({configOption, episodesOption, seedOption, checkpointOption,
                       resumeOption, metricsOption, quietOption});
    parser.process(app);

    TrainingOptions options;
    if (parser.isSet(configOption)) {
        QString error;
        if (!loadTrainingOptions(parser.value(configOption), options, &error)) {
            qCritical("Configuration error: %s", qPrintable(error));
            return 1;
        }
    }

    if (parser.isSet(episodesOption)) options.episodes = parser.value(episodesOption).toInt();
    if (parser.isSet(seedOption)) {
        uint32_t seed = parser.value(seedOption).toUInt();
        options.policy.seed = seed;
        options.env.seed = seed;
    }
    if (parser.isSet(checkpointOption)) options.checkpoint = parser.value(checkpointOption);
    if (parser.isSet(resumeOption)) options.resume = parser.value(resumeOption);
    if (parser.isSet(metricsOption)) options.metrics = parser.value(metricsOption);
    if (parser.isSet(quietOption)) options.policy.verbose = false;

    if (options.episodes <= 0) {
        qCritical("Configuration error: episodes must be positive");
        return 1;
    }

    try {
        CuttingStockEnv env(options.env);
        PackingPolicy policy(options.policy);

        if (!options.resume.isEmpty() && !policy.load(options.resume.toStdString())) {
            qWarning("Could not resume from %s, starting from scratch", qPrintable(options.resume));
        }

        const std::string checkpointPath = options.checkpoint.toStdString();
        if (!ensureParentDir(options.checkpoint)) {
            qWarning("Cannot create directory for %s", qPrintable(options.checkpoint));
        }

        for (int episode = 0; episode < options.episodes; ++episode) {
            EnvStep start = env.reset();
            policy.initialize(start.observation);

            EnvStep last = runEpisode(env, policy, std::move(start));
            bool recorded = policy.endEpisode(last.observation);

            qInfo("Episode %d: steps %d, reward %.2f, filled %.3f, invalid %d%s",
                  episode, env.stepCount(), policy.episodeReward(),
                  correctedFilledRatio(last.observation), env.invalidPlacements(),
                  recorded ? "" : " (incomplete)");

            if (options.checkpoint_every > 0 && (episode + 1) % options.checkpoint_every == 0) {
                if (!policy.save(checkpointPath)) {
                    qWarning("Checkpoint after episode %d failed", episode);
                }
            }
        }

        const TrainingMetrics& metrics = policy.metrics();
        qInfo("Best filled ratio %.3f, best reward %.2f (episode %d)",
              metrics.bestFilledRatio(), metrics.bestReward(), metrics.bestEpisode());

        if (!policy.save(checkpointPath)) {
            qWarning("Final checkpoint failed");
        }

        if (!options.metrics.isEmpty()) {
            QString error;
            if (!ensureParentDir(options.metrics) || !writeEpisodeCsv(options.metrics, metrics, &error)) {
                qWarning("Metrics export failed: %s", qPrintable(error));
            }
        }
    } catch (const std::invalid_argument& e) {
        qCritical("Configuration error: %s", e.what());
        return 1;
    }

    return 0;
}
