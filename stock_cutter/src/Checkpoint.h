#ifndef CHECKPOINT_H
#define CHECKPOINT_H

#include <Eigen/Core>
#include <cstdint>
#include <optional>
#include <string>

struct OptimizerState {
    int timestep = 0;
    float learningRate = 0.0f;
    Eigen::VectorXf firstMoment;
    Eigen::VectorXf secondMoment;
};

struct SchedulerState {
    float best = 0.0f;
    int badSteps = 0;
};

/**
 * @brief Everything needed to resume a packing policy
 *
 * Binary layout (native endianness): 8-byte magic "STKCKPT1", uint32
 * format version, then the fields below in declaration order. Vectors are
 * stored as an int32 length followed by float data.
 */
struct CheckpointData {
    static constexpr char kMagic[9] = "STKCKPT1";
    static constexpr uint32_t kVersion = 1;
    static constexpr const char* kExtension = ".ckpt";

    int32_t stateDim = 0;
    int32_t actionDim = 0;
    int32_t productSlots = 0;
    int32_t initialDemand = 0;
    int64_t steps = 0;
    bool exploiting = false;

    Eigen::VectorXf actorParams;
    Eigen::VectorXf criticParams;
    OptimizerState actorOptimizer;
    OptimizerState criticOptimizer;
    SchedulerState actorScheduler;
    SchedulerState criticScheduler;
    Eigen::VectorXf normalizerMean;
    Eigen::VectorXf normalizerStd;
};

namespace checkpoint {

// Appends the checkpoint extension unless the path already ends with it
std::string withExtension(const std::string& path);

// Writes to "<path>.tmp" and renames it into place; returns false on any I/O failure
bool write(const std::string& path, const CheckpointData& data);

// std::nullopt for a missing, truncated or foreign file
std::optional<CheckpointData> read(const std::string& path);

} // namespace checkpoint

#endif // CHECKPOINT_H
