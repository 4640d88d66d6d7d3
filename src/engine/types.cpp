// SPDX-License-Identifier: Apache-2.0
#include "engine/types.hpp"

#include <cctype>

namespace {

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // namespace

namespace dball::engine {

std::string_view to_string(Side s) noexcept
{
    return s == Side::Home ? "home" : "away";
}

std::string_view to_string(Role r) noexcept
{
    switch (r) {
        case Role::Passer:
            return "Passer";
        case Role::Runner:
            return "Runner";
        case Role::Blocker:
            return "Blocker";
        case Role::Unknown:
            break;
    }
    return "Unknown";
}

std::string_view to_string(Race r) noexcept
{
    switch (r) {
        case Race::Human:
            return "Human";
        case Race::Sylvan:
            return "Sylvan";
        case Race::Gryll:
            return "Gryll";
        case Race::Lumina:
            return "Lumina";
        case Race::Umbra:
            return "Umbra";
        case Race::Unknown:
            break;
    }
    return "Unknown";
}

std::string_view to_string(Stat s) noexcept
{
    switch (s) {
        case Stat::Speed:
            return "speed";
        case Stat::Power:
            return "power";
        case Stat::Throwing:
            return "throwing";
        case Stat::Catching:
            return "catching";
        case Stat::Kicking:
            return "kicking";
        case Stat::Stamina:
            return "stamina";
        case Stat::Agility:
            return "agility";
        case Stat::Leadership:
            return "leadership";
    }
    return "speed";
}

std::string_view to_string(EventType t) noexcept
{
    switch (t) {
        case EventType::RoutinePlay:
            return "routine_play";
        case EventType::Score:
            return "score";
        case EventType::Turnover:
            return "turnover";
    }
    return "routine_play";
}

std::string_view to_string(Priority p) noexcept
{
    switch (p) {
        case Priority::Critical:
            return "critical";
        case Priority::Important:
            return "important";
        case Priority::Standard:
            return "standard";
        case Priority::Downtime:
            return "downtime";
    }
    return "standard";
}

std::string_view to_string(GamePhase p) noexcept
{
    switch (p) {
        case GamePhase::Early:
            return "early";
        case GamePhase::Middle:
            return "middle";
        case GamePhase::Late:
            return "late";
        case GamePhase::Clutch:
            return "clutch";
    }
    return "early";
}

std::string_view to_string(ActionKind k) noexcept
{
    switch (k) {
        case ActionKind::Run:
            return "run";
        case ActionKind::Pass:
            return "pass";
        case ActionKind::Kick:
            return "kick";
        case ActionKind::Defense:
            return "defense";
    }
    return "run";
}

Role parse_role(std::string_view tag) noexcept
{
    if (iequals(tag, "passer"))
        return Role::Passer;
    if (iequals(tag, "runner"))
        return Role::Runner;
    if (iequals(tag, "blocker"))
        return Role::Blocker;
    return Role::Unknown;
}

Race parse_race(std::string_view tag) noexcept
{
    if (iequals(tag, "human"))
        return Race::Human;
    if (iequals(tag, "sylvan"))
        return Race::Sylvan;
    if (iequals(tag, "gryll"))
        return Race::Gryll;
    if (iequals(tag, "lumina"))
        return Race::Lumina;
    if (iequals(tag, "umbra"))
        return Race::Umbra;
    return Race::Unknown;
}

std::optional<Stat> parse_stat(std::string_view name) noexcept
{
    for (size_t i = 0; i < kStatCount; ++i) {
        auto s = static_cast<Stat>(i);
        if (iequals(name, to_string(s)))
            return s;
    }
    return std::nullopt;
}

} // namespace dball::engine
