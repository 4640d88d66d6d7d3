// SPDX-License-Identifier: Apache-2.0
#include "engine/balance_config.hpp"

#include "common/logger.hpp"

namespace dball::engine {

namespace {

void override_double(const YAML::Node &root, const char *key, double &field)
{
    if (root[key])
        field = root[key].as<double>();
}

void apply_race_overrides(RaceProfile &p, const YAML::Node &node)
{
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto key = it->first.as<std::string>();
        if (auto stat = parse_stat(key)) {
            p.deltas[*stat] = it->second.as<double>();
        } else if (key == "drain_multiplier") {
            p.drain_multiplier = it->second.as<double>();
        } else if (key == "regen_chance") {
            if (!p.regen)
                p.regen = RegenRule{};
            p.regen->chance = it->second.as<double>();
        } else if (key == "regen_amount") {
            if (!p.regen)
                p.regen = RegenRule{};
            p.regen->amount = it->second.as<double>();
        } else if (key == "run_flavor") {
            if (it->second.IsNull()) {
                p.run_flavor.reset();
                continue;
            }
            FlavorWindow w;
            w.pool = it->second["pool"].as<std::string>();
            if (it->second["min_yards"])
                w.min_yards = it->second["min_yards"].as<double>();
            if (it->second["above_yards"]) {
                w.min_yards = it->second["above_yards"].as<double>();
                w.exclusive_min = true;
            }
            if (it->second["max_yards"])
                w.max_yards = it->second["max_yards"].as<double>();
            p.run_flavor = w;
        } else if (key == "pass_flavor") {
            if (it->second.IsNull())
                p.pass_flavor.reset();
            else
                p.pass_flavor = it->second.as<std::string>();
        } else {
            dball::log::warn("[config] unknown race field '{}' ignored", key);
        }
    }
}

} // namespace

double BalanceConfig::advance_for(Priority p) const noexcept
{
    switch (p) {
        case Priority::Critical:
            return critical_advance_sec;
        case Priority::Important:
            return important_advance_sec;
        case Priority::Standard:
            return standard_advance_sec;
        case Priority::Downtime:
            return downtime_advance_sec;
    }
    return standard_advance_sec;
}

void validate(const BalanceConfig &cfg)
{
    if (!(cfg.match_duration_sec > 0.0))
        throw ConfigError("match_duration_sec must be positive");
    for (auto p : {Priority::Critical, Priority::Important, Priority::Standard, Priority::Downtime}) {
        if (!(cfg.advance_for(p) > 0.0))
            throw ConfigError("clock advance for " + std::string(to_string(p)) + " must be positive");
    }
    if (cfg.run_weight < 0 || cfg.pass_weight < 0 || cfg.kick_weight < 0 || cfg.defense_weight < 0)
        throw ConfigError("action weights must be non-negative");
    if (!(cfg.total_action_weight() > 0.0))
        throw ConfigError("action weights sum to zero");
    if (!(cfg.max_fatigue_penalty >= 0.0 && cfg.max_fatigue_penalty <= 0.5))
        throw ConfigError("max_fatigue_penalty must lie in [0, 0.5]");
    if (!(cfg.fatigue_threshold > 0.0))
        throw ConfigError("fatigue_threshold must be positive");
    if (cfg.base_stamina_drain < 0.0 || cfg.demanding_role_drain_multiplier < 0.0)
        throw ConfigError("stamina drain must be non-negative");
    if (cfg.halftime_stamina_recovery < 0.0)
        throw ConfigError("halftime_stamina_recovery must be non-negative");
    if (!(0.0 <= cfg.middle_phase_at && cfg.middle_phase_at <= cfg.late_phase_at
          && cfg.late_phase_at <= cfg.clutch_phase_at && cfg.clutch_phase_at <= 1.0))
        throw ConfigError("phase boundaries must be ordered within [0, 1]");
    for (size_t i = 0; i < kRaceCount; ++i) {
        const auto &r = cfg.races[i];
        auto name = std::string(to_string(static_cast<Race>(i)));
        if (r.drain_multiplier < 0.0)
            throw ConfigError("race " + name + ": drain_multiplier must be non-negative");
        if (r.regen && !(r.regen->chance >= 0.0 && r.regen->chance <= 1.0))
            throw ConfigError("race " + name + ": regen_chance must lie in [0, 1]");
        if (r.regen && !(r.regen->amount >= 0.0))
            throw ConfigError("race " + name + ": regen_amount must be non-negative");
    }
}

void apply_balance_overrides(BalanceConfig &cfg, const YAML::Node &root)
{
    override_double(root, "match_duration_sec", cfg.match_duration_sec);
    override_double(root, "run_weight", cfg.run_weight);
    override_double(root, "pass_weight", cfg.pass_weight);
    override_double(root, "kick_weight", cfg.kick_weight);
    override_double(root, "defense_weight", cfg.defense_weight);
    override_double(root, "run_base_success_pct", cfg.run_base_success_pct);
    override_double(root, "run_success_base_yards", cfg.run_success_base_yards);
    override_double(root, "run_speed_divisor", cfg.run_speed_divisor);
    override_double(root, "run_success_random_yards", cfg.run_success_random_yards);
    override_double(root, "run_stuffed_random_yards", cfg.run_stuffed_random_yards);
    override_double(root, "breakaway_min_yards", cfg.breakaway_min_yards);
    override_double(root, "breakaway_speed_threshold", cfg.breakaway_speed_threshold);
    override_double(root, "breakaway_score_chance", cfg.breakaway_score_chance);
    override_double(root, "run_score_chance", cfg.run_score_chance);
    override_double(root, "pass_base_completion", cfg.pass_base_completion);
    override_double(root, "pass_base_yards", cfg.pass_base_yards);
    override_double(root, "pass_throwing_divisor", cfg.pass_throwing_divisor);
    override_double(root, "pass_random_yards", cfg.pass_random_yards);
    override_double(root, "deep_pass_min_yards", cfg.deep_pass_min_yards);
    override_double(root, "deep_pass_score_chance", cfg.deep_pass_score_chance);
    override_double(root, "pass_score_chance", cfg.pass_score_chance);
    override_double(root, "drop_base_chance", cfg.drop_base_chance);
    override_double(root, "drop_catching_pivot", cfg.drop_catching_pivot);
    override_double(root, "interception_base_chance", cfg.interception_base_chance);
    override_double(root, "kick_base_distance", cfg.kick_base_distance);
    override_double(root, "kick_random_distance", cfg.kick_random_distance);
    override_double(root, "kick_base_score_chance", cfg.kick_base_score_chance);
    override_double(root, "kick_kicking_pivot", cfg.kick_kicking_pivot);
    override_double(root, "tackle_base_chance", cfg.tackle_base_chance);
    override_double(root, "power_tackle_threshold", cfg.power_tackle_threshold);
    override_double(root, "fumble_base_chance", cfg.fumble_base_chance);
    override_double(root, "evasion_random_yards", cfg.evasion_random_yards);
    override_double(root, "scramble_offense_base", cfg.scramble_offense_base);
    override_double(root, "base_stamina_drain", cfg.base_stamina_drain);
    override_double(root, "demanding_role_drain_multiplier", cfg.demanding_role_drain_multiplier);
    override_double(root, "fatigue_threshold", cfg.fatigue_threshold);
    override_double(root, "max_fatigue_penalty", cfg.max_fatigue_penalty);
    override_double(root, "halftime_stamina_recovery", cfg.halftime_stamina_recovery);
    override_double(root, "critical_advance_sec", cfg.critical_advance_sec);
    override_double(root, "important_advance_sec", cfg.important_advance_sec);
    override_double(root, "standard_advance_sec", cfg.standard_advance_sec);
    override_double(root, "downtime_advance_sec", cfg.downtime_advance_sec);
    override_double(root, "middle_phase_at", cfg.middle_phase_at);
    override_double(root, "late_phase_at", cfg.late_phase_at);
    override_double(root, "clutch_phase_at", cfg.clutch_phase_at);

    if (root["races"]) {
        const auto &races = root["races"];
        for (auto it = races.begin(); it != races.end(); ++it) {
            auto tag = it->first.as<std::string>();
            Race race = parse_race(tag);
            if (race == Race::Unknown && tag != "unknown" && tag != "Unknown") {
                dball::log::warn("[config] unknown race '{}' in races section ignored", tag);
                continue;
            }
            apply_race_overrides(cfg.races[static_cast<size_t>(race)], it->second);
        }
    }
}

BalanceConfig load_balance_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    BalanceConfig cfg;
    apply_balance_overrides(cfg, root);
    validate(cfg);
    dball::log::debug("[config] balance loaded path={} duration={}s", path, cfg.match_duration_sec);
    return cfg;
}

} // namespace dball::engine
