#ifndef TRAININGOPTIONS_H
#define TRAININGOPTIONS_H

#include "CuttingStockEnv.h"
#include "PolicyConfig.h"
#include <QString>

class QJsonObject;
class TrainingMetrics;

/**
 * @brief Settings of one training run of the driver
 *
 * JSON layout, every key optional:
 * {
 *   "policy":   { PolicyConfig field names },
 *   "env":      { EnvConfig field names },
 *   "training": { "episodes", "checkpoint", "checkpoint_every", "resume", "metrics" }
 * }
 */
struct TrainingOptions {
    PolicyConfig policy;
    EnvConfig env;

    int episodes = 100;
    int checkpoint_every = 10;   // 0 disables periodic checkpoints
    QString checkpoint = QStringLiteral("saved_models/stock_cutter");
    QString resume;              // checkpoint to load before training
    QString metrics;             // CSV of per-episode results, empty to skip
};

// Overrides the fields present in the JSON file; false with `error` set on failure
bool loadTrainingOptions(const QString& path, TrainingOptions& options, QString* error);

void applyPolicyJson(const QJsonObject& json, PolicyConfig& config);
void applyEnvJson(const QJsonObject& json, EnvConfig& config);

// episode,filled_ratio,total_reward rows
bool writeEpisodeCsv(const QString& path, const TrainingMetrics& metrics, QString* error);

#endif // TRAININGOPTIONS_H
