// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/race_modifiers.hpp"
#include "engine/types.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace dball::engine {

// Balance constants consumed by the engine. Defaults reproduce the league rules; every field can
// be overridden from YAML.
struct BalanceConfig
{
    double match_duration_sec{2400.0};

    // Action selection weights (relative; must not all be zero)
    double run_weight{1.0};
    double pass_weight{1.0};
    double kick_weight{1.0};
    double defense_weight{1.0};

    // Run
    double run_base_success_pct{50.0};
    double run_success_base_yards{2.0};
    double run_speed_divisor{5.0};
    double run_success_random_yards{5.0};
    double run_stuffed_random_yards{3.0};
    double breakaway_min_yards{12.0};
    double breakaway_speed_threshold{30.0};
    double breakaway_score_chance{0.4};
    double run_score_chance{0.05};

    // Pass
    double pass_base_completion{0.55};
    double pass_base_yards{3.0};
    double pass_throwing_divisor{5.0};
    double pass_random_yards{10.0};
    double deep_pass_min_yards{20.0};
    double deep_pass_score_chance{0.3};
    double pass_score_chance{0.08};
    double drop_base_chance{0.25};
    double drop_catching_pivot{20.0}; // catching rating at which the base drop chance applies
    double interception_base_chance{0.35};

    // Kick
    double kick_base_distance{15.0};
    double kick_random_distance{15.0};
    double kick_base_score_chance{0.2};
    double kick_kicking_pivot{20.0};

    // Defense / loose ball
    double tackle_base_chance{0.5};
    double power_tackle_threshold{30.0};
    double fumble_base_chance{0.1};
    double evasion_random_yards{4.0};
    double scramble_offense_base{0.5};

    // Stamina & fatigue
    double base_stamina_drain{1.0};
    double demanding_role_drain_multiplier{1.5}; // Runner and Passer
    double fatigue_threshold{20.0};
    double max_fatigue_penalty{0.5};
    double halftime_stamina_recovery{0.0}; // 0 disables

    // Clock advance per tick, by event priority
    double critical_advance_sec{20.0};
    double important_advance_sec{15.0};
    double standard_advance_sec{10.0};
    double downtime_advance_sec{5.0};

    // Phase boundaries as fractions of match duration
    double middle_phase_at{0.25};
    double late_phase_at{0.75};
    double clutch_phase_at{0.9};

    RaceTable races{default_race_table()};

    double advance_for(Priority p) const noexcept;
    double total_action_weight() const noexcept { return run_weight + pass_weight + kick_weight + defense_weight; }
};

// Throws ConfigError describing the first invalid field.
void validate(const BalanceConfig &cfg);

// Apply YAML overrides onto an existing config (only keys present are overridden).
void apply_balance_overrides(BalanceConfig &cfg, const YAML::Node &root);

// Defaults plus the overrides found in the file. YAML::Exception propagates for unreadable files;
// the result is validated.
BalanceConfig load_balance_config(const std::string &path);

} // namespace dball::engine
