#include "TrainingOptions.h"
#include "TrainingMetrics.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QTextStream>

namespace {

template <typename T>
void readNumber(const QJsonObject& json, const char* key, T& value) {
    const QJsonValue v = json.value(QLatin1String(key));
    if (v.isDouble()) value = static_cast<T>(v.toDouble());
}

void readBool(const QJsonObject& json, const char* key, bool& value) {
    const QJsonValue v = json.value(QLatin1String(key));
    if (v.isBool()) value = v.toBool();
}

void readString(const QJsonObject& json, const char* key, QString& value) {
    const QJsonValue v = json.value(QLatin1String(key));
    if (v.isString()) value = v.toString();
}

} // namespace

void applyPolicyJson(const QJsonObject& json, PolicyConfig& c) {
    readNumber(json, "warmup_steps", c.warmup_steps);
    readNumber(json, "exploit_demand_fraction", c.exploit_demand_fraction);
    readNumber(json, "greedy_budget", c.greedy_budget);
    readNumber(json, "random_trials", c.random_trials);
    readNumber(json, "decode_rotation_bonus", c.decode_rotation_bonus);
    readNumber(json, "greedy_rotation_bonus", c.greedy_rotation_bonus);

    readNumber(json, "boost_start", c.boost_start);
    readNumber(json, "boost_min", c.boost_min);
    readNumber(json, "boost_decay_steps", c.boost_decay_steps);
    readNumber(json, "temperature_min", c.temperature_min);
    readNumber(json, "temperature_decay_steps", c.temperature_decay_steps);

    readNumber(json, "update_trigger", c.update_trigger);
    readNumber(json, "ppo_epochs", c.ppo_epochs);
    readNumber(json, "gamma", c.gamma);
    readNumber(json, "gae_lambda", c.gae_lambda);
    readNumber(json, "clip_epsilon", c.clip_epsilon);
    readNumber(json, "entropy_coef", c.entropy_coef);
    readNumber(json, "value_coef", c.value_coef);
    readNumber(json, "critic_l2", c.critic_l2);
    readNumber(json, "max_grad_norm", c.max_grad_norm);
    readNumber(json, "actor_lr", c.actor_lr);
    readNumber(json, "critic_lr", c.critic_lr);

    readNumber(json, "lr_factor", c.lr_factor);
    readNumber(json, "lr_patience", c.lr_patience);
    readNumber(json, "lr_threshold", c.lr_threshold);

    readNumber(json, "seed", c.seed);
    readBool(json, "verbose", c.verbose);
}

void applyEnvJson(const QJsonObject& json, EnvConfig& c) {
    readNumber(json, "num_stocks", c.num_stocks);
    readNumber(json, "min_stock_size", c.min_stock_size);
    readNumber(json, "max_stock_size", c.max_stock_size);
    readNumber(json, "num_product_types", c.num_product_types);
    readNumber(json, "min_product_size", c.min_product_size);
    readNumber(json, "max_product_size", c.max_product_size);
    readNumber(json, "min_quantity", c.min_quantity);
    readNumber(json, "max_quantity", c.max_quantity);
    readNumber(json, "max_steps", c.max_steps);
    readNumber(json, "seed", c.seed);
}

bool loadTrainingOptions(const QString& path, TrainingOptions& options, QString* error) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QStringLiteral("%1 is not a JSON object: %2").arg(path, parseError.errorString());
        }
        return false;
    }

    const QJsonObject root = doc.object();
    applyPolicyJson(root.value(QLatin1String("policy")).toObject(), options.policy);
    applyEnvJson(root.value(QLatin1String("env")).toObject(), options.env);

    const QJsonObject training = root.value(QLatin1String("training")).toObject();
    readNumber(training, "episodes", options.episodes);
    readNumber(training, "checkpoint_every", options.checkpoint_every);
    readString(training, "checkpoint", options.checkpoint);
    readString(training, "resume", options.resume);
    readString(training, "metrics", options.metrics);
    return true;
}

bool writeEpisodeCsv(const QString& path, const TrainingMetrics& metrics, QString* error) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (error) *error = QStringLiteral("cannot write %1: %2").arg(path, file.errorString());
        return false;
    }

    QTextStream out(&file);
    out << "episode,filled_ratio,total_reward\n";
    for (const EpisodeRecord& record : metrics.episodes()) {
        out << record.episode << ',' << record.filledRatio << ',' << record.totalReward << '\n';
    }
    out.flush();

    if (out.status() != QTextStream::Ok) {
        if (error) *error = QStringLiteral("write error on %1").arg(path);
        return false;
    }
    return true;
}
