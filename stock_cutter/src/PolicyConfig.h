#ifndef POLICYCONFIG_H
#define POLICYCONFIG_H

#include <cstdint>

/**
 * @brief Tunables of the packing policy and its PPO training loop
 *
 * Defaults reproduce the reference training setup. validate() throws
 * std::invalid_argument naming the first offending field.
 */
struct PolicyConfig {
    // Decision pipeline
    long warmup_steps = 2000;              // structured placement below this step count
    float exploit_demand_fraction = 0.7f;  // ... or while remaining demand exceeds this share
    int greedy_budget = 1000;              // positions evaluated by the greedy fallback
    int random_trials = 10;                // per stock / product / orientation
    float decode_rotation_bonus = 1.1f;
    float greedy_rotation_bonus = 1.05f;

    // Action sampling
    float boost_start = 3.0f;
    float boost_min = 1.0f;
    float boost_decay_steps = 10000.0f;
    float temperature_min = 0.1f;
    float temperature_decay_steps = 20000.0f;

    // PPO
    int update_trigger = 128;  // finalized experiences before an update
    int ppo_epochs = 10;
    float gamma = 0.99f;
    float gae_lambda = 0.95f;
    float clip_epsilon = 0.2f;
    float entropy_coef = 0.01f;
    float value_coef = 0.25f;
    float critic_l2 = 0.01f;
    float max_grad_norm = 0.1f;
    float actor_lr = 3e-4f;
    float critic_lr = 1e-3f;

    // Reduce-on-plateau
    float lr_factor = 0.5f;
    int lr_patience = 5;
    float lr_threshold = 1e-4f;

    uint32_t seed = 0;
    bool verbose = true;

    void validate() const;
};

#endif // POLICYCONFIG_H
