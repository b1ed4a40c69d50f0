#include "Checkpoint.h"
#include <cstdio>
#include <cstring>
#include <fstream>

namespace checkpoint {

namespace {

// Upper bound on stored vector lengths, rejects garbage sizes before allocating
constexpr int32_t kMaxVectorSize = 1 << 28;

template <typename T>
void writePod(std::ofstream& file, const T& value) {
    file.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
bool readPod(std::ifstream& file, T& value) {
    file.read(reinterpret_cast<char*>(&value), sizeof(T));
    return static_cast<bool>(file);
}

void writeVector(std::ofstream& file, const Eigen::VectorXf& vec) {
    int32_t size = static_cast<int32_t>(vec.size());
    writePod(file, size);
    file.write(reinterpret_cast<const char*>(vec.data()), size * sizeof(float));
}

bool readVector(std::ifstream& file, Eigen::VectorXf& vec) {
    int32_t size = 0;
    if (!readPod(file, size) || size < 0 || size > kMaxVectorSize) return false;
    vec.resize(size);
    file.read(reinterpret_cast<char*>(vec.data()), size * sizeof(float));
    return static_cast<bool>(file);
}

void writeOptimizer(std::ofstream& file, const OptimizerState& state) {
    writePod(file, static_cast<int32_t>(state.timestep));
    writePod(file, state.learningRate);
    writeVector(file, state.firstMoment);
    writeVector(file, state.secondMoment);
}

bool readOptimizer(std::ifstream& file, OptimizerState& state) {
    int32_t timestep = 0;
    if (!readPod(file, timestep) || !readPod(file, state.learningRate)) return false;
    state.timestep = timestep;
    return readVector(file, state.firstMoment) && readVector(file, state.secondMoment);
}

void writeScheduler(std::ofstream& file, const SchedulerState& state) {
    writePod(file, state.best);
    writePod(file, static_cast<int32_t>(state.badSteps));
}

bool readScheduler(std::ifstream& file, SchedulerState& state) {
    int32_t badSteps = 0;
    if (!readPod(file, state.best) || !readPod(file, badSteps)) return false;
    state.badSteps = badSteps;
    return true;
}

} // namespace

std::string withExtension(const std::string& path) {
    const std::string ext = CheckpointData::kExtension;
    if (path.size() >= ext.size() && path.compare(path.size() - ext.size(), ext.size(), ext) == 0) {
        return path;
    }
    return path + ext;
}

bool write(const std::string& path, const CheckpointData& data) {
    const std::string finalPath = withExtension(path);
    const std::string tmpPath = finalPath + ".tmp";

    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file) return false;

        file.write(CheckpointData::kMagic, 8);
        writePod(file, CheckpointData::kVersion);
        writePod(file, data.stateDim);
        writePod(file, data.actionDim);
        writePod(file, data.productSlots);
        writePod(file, data.initialDemand);
        writePod(file, data.steps);
        writePod(file, static_cast<uint8_t>(data.exploiting ? 1 : 0));

        writeVector(file, data.actorParams);
        writeVector(file, data.criticParams);
        writeOptimizer(file, data.actorOptimizer);
        writeOptimizer(file, data.criticOptimizer);
        writeScheduler(file, data.actorScheduler);
        writeScheduler(file, data.criticScheduler);
        writeVector(file, data.normalizerMean);
        writeVector(file, data.normalizerStd);

        file.flush();
        if (!file.good()) {
            file.close();
            std::remove(tmpPath.c_str());
            return false;
        }
    }

    if (std::rename(tmpPath.c_str(), finalPath.c_str()) != 0) {
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

std::optional<CheckpointData> read(const std::string& path) {
    std::ifstream file(withExtension(path), std::ios::binary);
    if (!file) return std::nullopt;

    char magic[8] = {0};
    file.read(magic, 8);
    if (!file || std::memcmp(magic, CheckpointData::kMagic, 8) != 0) return std::nullopt;

    uint32_t version = 0;
    if (!readPod(file, version) || version != CheckpointData::kVersion) return std::nullopt;

    CheckpointData data;
    uint8_t exploiting = 0;
    bool ok = readPod(file, data.stateDim) &&
              readPod(file, data.actionDim) &&
              readPod(file, data.productSlots) &&
              readPod(file, data.initialDemand) &&
              readPod(file, data.steps) &&
              readPod(file, exploiting) &&
              readVector(file, data.actorParams) &&
              readVector(file, data.criticParams) &&
              readOptimizer(file, data.actorOptimizer) &&
              readOptimizer(file, data.criticOptimizer) &&
              readScheduler(file, data.actorScheduler) &&
              readScheduler(file, data.criticScheduler) &&
              readVector(file, data.normalizerMean) &&
              readVector(file, data.normalizerStd);
    if (!ok) return std::nullopt;

    data.exploiting = exploiting != 0;
    return data;
}

} // namespace checkpoint
