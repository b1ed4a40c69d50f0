#include "PolicyConfig.h"
#include <stdexcept>
#include <string>

namespace {

void require(bool condition, const char* field) {
    if (!condition) {
        throw std::invalid_argument(std::string("PolicyConfig: invalid ") + field);
    }
}

} // namespace

void PolicyConfig::validate() const {
    require(warmup_steps >= 0, "warmup_steps");
    require(exploit_demand_fraction >= 0.0f && exploit_demand_fraction <= 1.0f, "exploit_demand_fraction");
    require(greedy_budget > 0, "greedy_budget");
    require(random_trials >= 0, "random_trials");
    require(decode_rotation_bonus > 0.0f, "decode_rotation_bonus");
    require(greedy_rotation_bonus > 0.0f, "greedy_rotation_bonus");

    require(boost_min >= 0.0f && boost_start >= boost_min, "boost_start");
    require(boost_decay_steps > 0.0f, "boost_decay_steps");
    require(temperature_min > 0.0f && temperature_min <= 1.0f, "temperature_min");
    require(temperature_decay_steps > 0.0f, "temperature_decay_steps");

    require(update_trigger > 0, "update_trigger");
    require(ppo_epochs > 0, "ppo_epochs");
    require(gamma >= 0.0f && gamma <= 1.0f, "gamma");
    require(gae_lambda >= 0.0f && gae_lambda <= 1.0f, "gae_lambda");
    require(clip_epsilon > 0.0f, "clip_epsilon");
    require(entropy_coef >= 0.0f, "entropy_coef");
    require(value_coef > 0.0f, "value_coef");
    require(critic_l2 >= 0.0f, "critic_l2");
    require(max_grad_norm > 0.0f, "max_grad_norm");
    require(actor_lr > 0.0f, "actor_lr");
    require(critic_lr > 0.0f, "critic_lr");

    require(lr_factor > 0.0f && lr_factor < 1.0f, "lr_factor");
    require(lr_patience >= 0, "lr_patience");
    require(lr_threshold >= 0.0f, "lr_threshold");
}
