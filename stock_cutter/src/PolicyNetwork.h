#ifndef POLICYNETWORK_H
#define POLICYNETWORK_H

#include <Eigen/Core>
#include <cstdint>
#include <random>
#include <vector>

/**
 * @brief Fully connected network with optional LayerNorm + ReLU per layer
 *
 * Inputs are column vectors; a batch is a (features x batch) matrix.
 * forwardTraining() keeps the activations needed by backward(), which then
 * fills the gradient of every parameter for the given output gradient.
 *
 * Parameters are exposed as one flat vector (per layer: W, b, gamma, beta)
 * so optimizers and checkpoints can treat the network as a single tensor.
 */
class DenseNetwork {
public:
    struct LayerSpec {
        int outputs = 0;
        bool layerNorm = false;
        bool relu = false;
        float gain = 1.0f;   // orthogonal init gain
    };

    static constexpr float kLayerNormEps = 1e-5f;

    DenseNetwork(int inputDim, const std::vector<LayerSpec>& layers, bool zeroBias, uint32_t seed);

    int inputDim() const { return m_inputDim; }
    int outputDim() const;

    Eigen::MatrixXf forward(const Eigen::MatrixXf& input) const;

    // Same as forward(), caching activations for backward()
    Eigen::MatrixXf forwardTraining(const Eigen::MatrixXf& input);

    // Gradient of a scalar loss w.r.t. the last forwardTraining() output
    void backward(const Eigen::MatrixXf& outputGrad);

    Eigen::VectorXf getParameters() const;
    void setParameters(const Eigen::VectorXf& params);
    Eigen::VectorXf getGradients() const;
    int parameterCount() const;

    // Sum of squares over every parameter
    float parameterSquaredNorm() const;

private:
    struct Layer {
        Eigen::MatrixXf W;
        Eigen::VectorXf b;
        Eigen::VectorXf gamma;
        Eigen::VectorXf beta;
        bool layerNorm = false;
        bool relu = false;

        Eigen::MatrixXf dW;
        Eigen::VectorXf db;
        Eigen::VectorXf dGamma;
        Eigen::VectorXf dBeta;

        // forwardTraining() cache
        Eigen::MatrixXf input;
        Eigen::MatrixXf normalized;
        Eigen::RowVectorXf invStd;
        Eigen::MatrixXf output;      // before ReLU
    };

    static void orthogonalInit(Eigen::MatrixXf& W, float gain, std::mt19937& gen);
    static Eigen::MatrixXf layerForward(const Layer& layer, const Eigen::MatrixXf& x,
                                        Eigen::MatrixXf* normalized, Eigen::RowVectorXf* invStd,
                                        Eigen::MatrixXf* preActivation);

    int m_inputDim;
    std::vector<Layer> m_layers;
};

/**
 * @brief Actor and critic approximators over the encoded state
 *
 * Actor: state -> 256 -> 128 -> action logits (LayerNorm + ReLU hidden layers)
 * Critic: state -> 128 -> 32 -> 1
 *
 * Single-state calls return a vector / scalar, batch calls return a matrix /
 * vector with one column (entry) per state.
 */
class ActorCriticNetwork {
public:
    ActorCriticNetwork(int stateDim, int actionDim, uint32_t seed = 0);

    Eigen::VectorXf actorForward(const Eigen::VectorXf& state) const;
    Eigen::MatrixXf actorForward(const Eigen::MatrixXf& states) const;

    float criticForward(const Eigen::VectorXf& state) const;
    Eigen::VectorXf criticForward(const Eigen::MatrixXf& states) const;

    Eigen::VectorXf getActorParams() const { return m_actor.getParameters(); }
    Eigen::VectorXf getCriticParams() const { return m_critic.getParameters(); }
    void setActorParams(const Eigen::VectorXf& params) { m_actor.setParameters(params); }
    void setCriticParams(const Eigen::VectorXf& params) { m_critic.setParameters(params); }
    int actorParamCount() const { return m_actor.parameterCount(); }
    int criticParamCount() const { return m_critic.parameterCount(); }

    int stateDim() const { return m_actor.inputDim(); }
    int actionDim() const { return m_actor.outputDim(); }

    DenseNetwork& actor() { return m_actor; }
    DenseNetwork& critic() { return m_critic; }
    const DenseNetwork& actor() const { return m_actor; }
    const DenseNetwork& critic() const { return m_critic; }

private:
    DenseNetwork m_actor;
    DenseNetwork m_critic;
};

#endif // POLICYNETWORK_H
