// SPDX-License-Identifier: Apache-2.0
#include "roster/roster_loader.hpp"

#include "common/logger.hpp"

namespace dball::roster {

namespace {

void read_stat_map(const YAML::Node &node, engine::StatBlock &out, const std::string &where, const char *what)
{
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto name = it->first.as<std::string>();
        auto stat = engine::parse_stat(name);
        if (!stat) {
            dball::log::warn("[roster] {}: unknown {} '{}' ignored", where, what, name);
            continue;
        }
        out[*stat] = it->second.as<double>();
    }
}

engine::RosterPlayer parse_player(const YAML::Node &node, const std::string &source, size_t index)
{
    engine::RosterPlayer p;
    if (node["id"])
        p.id = node["id"].as<std::string>();
    const std::string where = source + " player " + (p.id.empty() ? "#" + std::to_string(index) : p.id);
    if (node["name"])
        p.name = node["name"].as<std::string>();
    if (node["role"]) {
        auto tag = node["role"].as<std::string>();
        p.role = engine::parse_role(tag);
        if (p.role == engine::Role::Unknown)
            dball::log::warn("[roster] {}: unknown role '{}', no role modifiers apply", where, tag);
    }
    if (node["race"]) {
        auto tag = node["race"].as<std::string>();
        p.race = engine::parse_race(tag);
        if (p.race == engine::Race::Unknown)
            dball::log::warn("[roster] {}: unknown race '{}', no race modifiers apply", where, tag);
    }
    if (node["stats"])
        read_stat_map(node["stats"], p.base_stats, where, "stat");
    // Flat keys override the stats map.
    if (node["stamina_capacity"])
        p.base_stats[engine::Stat::Stamina] = node["stamina_capacity"].as<double>();
    if (node["leadership"])
        p.base_stats[engine::Stat::Leadership] = node["leadership"].as<double>();
    if (node["skills"])
        p.skills = node["skills"].as<std::vector<std::string>>();
    if (node["bonuses"])
        read_stat_map(node["bonuses"], p.bonuses, where, "bonus");
    return p;
}

} // namespace

engine::RosterSnapshot parse_roster(const YAML::Node &root, const std::string &source)
{
    engine::RosterSnapshot r;
    if (root["team_id"])
        r.team_id = root["team_id"].as<std::string>();
    if (root["name"])
        r.name = root["name"].as<std::string>();
    if (r.name.empty())
        r.name = r.team_id;
    if (root["players"]) {
        size_t index = 0;
        for (const auto &node : root["players"])
            r.players.push_back(parse_player(node, source, index++));
    }
    if (root["starters"])
        r.starters = root["starters"].as<std::vector<std::string>>();
    dball::log::debug("[roster] parsed {} team={} players={}", source, r.team_id, r.players.size());
    return r;
}

engine::RosterSnapshot load_roster(const std::string &path)
{
    return parse_roster(YAML::LoadFile(path), path);
}

} // namespace dball::roster
