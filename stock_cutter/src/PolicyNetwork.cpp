#include "PolicyNetwork.h"
#include <Eigen/QR>
#include <algorithm>
#include <cmath>
#include <stdexcept>

DenseNetwork::DenseNetwork(int inputDim, const std::vector<LayerSpec>& layers, bool zeroBias, uint32_t seed)
    : m_inputDim(inputDim)
{
    if (inputDim <= 0 || layers.empty()) {
        throw std::invalid_argument("DenseNetwork needs a positive input size and at least one layer");
    }

    std::mt19937 gen(seed);
    int fanIn = inputDim;

    for (const auto& spec : layers) {
        Layer layer;
        layer.W = Eigen::MatrixXf::Zero(spec.outputs, fanIn);
        orthogonalInit(layer.W, spec.gain, gen);

        layer.b = Eigen::VectorXf::Zero(spec.outputs);
        if (!zeroBias) {
            float bound = 1.0f / std::sqrt(static_cast<float>(fanIn));
            std::uniform_real_distribution<float> dist(-bound, bound);
            for (int i = 0; i < layer.b.size(); ++i) layer.b(i) = dist(gen);
        }

        layer.layerNorm = spec.layerNorm;
        layer.relu = spec.relu;
        if (layer.layerNorm) {
            layer.gamma = Eigen::VectorXf::Ones(spec.outputs);
            layer.beta = Eigen::VectorXf::Zero(spec.outputs);
        }

        m_layers.push_back(std::move(layer));
        fanIn = spec.outputs;
    }
}

void DenseNetwork::orthogonalInit(Eigen::MatrixXf& W, float gain, std::mt19937& gen) {
    const int rows = static_cast<int>(W.rows());
    const int cols = static_cast<int>(W.cols());
    const bool transposed = rows < cols;
    const int tall = std::max(rows, cols);
    const int wide = std::min(rows, cols);

    std::normal_distribution<float> dist(0.0f, 1.0f);
    Eigen::MatrixXf A(tall, wide);
    for (int i = 0; i < A.size(); ++i) A.data()[i] = dist(gen);

    Eigen::HouseholderQR<Eigen::MatrixXf> qr(A);
    Eigen::MatrixXf Q = qr.householderQ() * Eigen::MatrixXf::Identity(tall, wide);

    // Sign correction makes the distribution uniform over orthogonal matrices
    Eigen::VectorXf signs = qr.matrixQR().diagonal().head(wide).array().sign().matrix();
    for (int i = 0; i < signs.size(); ++i) {
        if (signs(i) == 0.0f) signs(i) = 1.0f;
    }
    Q = Q * signs.asDiagonal();

    W = gain * (transposed ? Eigen::MatrixXf(Q.transpose()) : Q);
}

int DenseNetwork::outputDim() const {
    return static_cast<int>(m_layers.back().W.rows());
}

Eigen::MatrixXf DenseNetwork::layerForward(const Layer& layer, const Eigen::MatrixXf& x,
                                           Eigen::MatrixXf* normalized, Eigen::RowVectorXf* invStd,
                                           Eigen::MatrixXf* preActivation) {
    Eigen::MatrixXf z = layer.W * x;
    z.colwise() += layer.b;

    if (layer.layerNorm) {
        Eigen::RowVectorXf mean = z.colwise().mean();
        Eigen::MatrixXf centered = z.rowwise() - mean;
        Eigen::RowVectorXf var = centered.array().square().colwise().mean();
        Eigen::RowVectorXf inv = (var.array() + kLayerNormEps).rsqrt();
        Eigen::MatrixXf xhat = (centered.array().rowwise() * inv.array()).matrix();

        z = (xhat.array().colwise() * layer.gamma.array()).matrix();
        z.colwise() += layer.beta;

        if (normalized) *normalized = xhat;
        if (invStd) *invStd = inv;
    }

    if (preActivation) *preActivation = z;
    if (layer.relu) z = z.cwiseMax(0.0f);
    return z;
}

Eigen::MatrixXf DenseNetwork::forward(const Eigen::MatrixXf& input) const {
    Eigen::MatrixXf x = input;
    for (const auto& layer : m_layers) {
        x = layerForward(layer, x, nullptr, nullptr, nullptr);
    }
    return x;
}

Eigen::MatrixXf DenseNetwork::forwardTraining(const Eigen::MatrixXf& input) {
    Eigen::MatrixXf x = input;
    for (auto& layer : m_layers) {
        layer.input = x;
        x = layerForward(layer, x, &layer.normalized, &layer.invStd, &layer.output);
    }
    return x;
}

void DenseNetwork::backward(const Eigen::MatrixXf& outputGrad) {
    Eigen::MatrixXf grad = outputGrad;

    for (int i = static_cast<int>(m_layers.size()) - 1; i >= 0; --i) {
        Layer& layer = m_layers[i];

        if (layer.relu) {
            grad = grad.cwiseProduct((layer.output.array() > 0.0f).cast<float>().matrix());
        }

        if (layer.layerNorm) {
            layer.dGamma = grad.cwiseProduct(layer.normalized).rowwise().sum();
            layer.dBeta = grad.rowwise().sum();

            Eigen::MatrixXf dXhat = (grad.array().colwise() * layer.gamma.array()).matrix();
            Eigen::RowVectorXf meanGrad = dXhat.colwise().mean();
            Eigen::RowVectorXf meanGradXhat = dXhat.cwiseProduct(layer.normalized).colwise().mean();

            Eigen::MatrixXf dz = dXhat.rowwise() - meanGrad;
            dz -= (layer.normalized.array().rowwise() * meanGradXhat.array()).matrix();
            grad = (dz.array().rowwise() * layer.invStd.array()).matrix();
        }

        layer.dW = grad * layer.input.transpose();
        layer.db = grad.rowwise().sum();

        if (i > 0) {
            grad = layer.W.transpose() * grad;
        }
    }
}

int DenseNetwork::parameterCount() const {
    int count = 0;
    for (const auto& layer : m_layers) {
        count += static_cast<int>(layer.W.size() + layer.b.size() + layer.gamma.size() + layer.beta.size());
    }
    return count;
}

Eigen::VectorXf DenseNetwork::getParameters() const {
    Eigen::VectorXf params(parameterCount());
    int idx = 0;

    for (const auto& layer : m_layers) {
        params.segment(idx, layer.W.size()) = Eigen::Map<const Eigen::VectorXf>(layer.W.data(), layer.W.size());
        idx += static_cast<int>(layer.W.size());
        params.segment(idx, layer.b.size()) = layer.b;
        idx += static_cast<int>(layer.b.size());
        if (layer.layerNorm) {
            params.segment(idx, layer.gamma.size()) = layer.gamma;
            idx += static_cast<int>(layer.gamma.size());
            params.segment(idx, layer.beta.size()) = layer.beta;
            idx += static_cast<int>(layer.beta.size());
        }
    }

    return params;
}

void DenseNetwork::setParameters(const Eigen::VectorXf& params) {
    if (params.size() != parameterCount()) {
        throw std::invalid_argument("DenseNetwork::setParameters: size mismatch");
    }

    int idx = 0;
    for (auto& layer : m_layers) {
        Eigen::Map<Eigen::VectorXf>(layer.W.data(), layer.W.size()) = params.segment(idx, layer.W.size());
        idx += static_cast<int>(layer.W.size());
        layer.b = params.segment(idx, layer.b.size());
        idx += static_cast<int>(layer.b.size());
        if (layer.layerNorm) {
            layer.gamma = params.segment(idx, layer.gamma.size());
            idx += static_cast<int>(layer.gamma.size());
            layer.beta = params.segment(idx, layer.beta.size());
            idx += static_cast<int>(layer.beta.size());
        }
    }
}

Eigen::VectorXf DenseNetwork::getGradients() const {
    Eigen::VectorXf grads = Eigen::VectorXf::Zero(parameterCount());
    int idx = 0;

    for (const auto& layer : m_layers) {
        if (layer.dW.size() == layer.W.size()) {
            grads.segment(idx, layer.W.size()) = Eigen::Map<const Eigen::VectorXf>(layer.dW.data(), layer.dW.size());
        }
        idx += static_cast<int>(layer.W.size());
        if (layer.db.size() == layer.b.size()) {
            grads.segment(idx, layer.b.size()) = layer.db;
        }
        idx += static_cast<int>(layer.b.size());
        if (layer.layerNorm) {
            if (layer.dGamma.size() == layer.gamma.size()) {
                grads.segment(idx, layer.gamma.size()) = layer.dGamma;
            }
            idx += static_cast<int>(layer.gamma.size());
            if (layer.dBeta.size() == layer.beta.size()) {
                grads.segment(idx, layer.beta.size()) = layer.dBeta;
            }
            idx += static_cast<int>(layer.beta.size());
        }
    }

    return grads;
}

float DenseNetwork::parameterSquaredNorm() const {
    float sum = 0.0f;
    for (const auto& layer : m_layers) {
        sum += layer.W.squaredNorm() + layer.b.squaredNorm() +
               layer.gamma.squaredNorm() + layer.beta.squaredNorm();
    }
    return sum;
}

ActorCriticNetwork::ActorCriticNetwork(int stateDim, int actionDim, uint32_t seed)
    : m_actor(stateDim,
              {{256, true, true, std::sqrt(2.0f)},
               {128, true, true, std::sqrt(2.0f)},
               {actionDim, false, false, 0.01f}},
              false, seed)
    , m_critic(stateDim,
               {{128, true, true, 0.01f},
                {32, true, true, 0.01f},
                {1, false, false, 0.01f}},
               true, seed + 1)
{
}

Eigen::VectorXf ActorCriticNetwork::actorForward(const Eigen::VectorXf& state) const {
    return m_actor.forward(state).col(0);
}

Eigen::MatrixXf ActorCriticNetwork::actorForward(const Eigen::MatrixXf& states) const {
    return m_actor.forward(states);
}

float ActorCriticNetwork::criticForward(const Eigen::VectorXf& state) const {
    return m_critic.forward(state)(0, 0);
}

Eigen::VectorXf ActorCriticNetwork::criticForward(const Eigen::MatrixXf& states) const {
    return m_critic.forward(states).row(0).transpose();
}
