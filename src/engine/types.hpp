// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dball::engine {

// Number of players each side keeps on the field for the whole match.
inline constexpr size_t kOnFieldCount = 6;

// Thrown at construction time for malformed rosters or balance configuration.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class Side : uint8_t
{
    Home = 0,
    Away = 1
};

inline constexpr Side opposite(Side s) noexcept
{
    return s == Side::Home ? Side::Away : Side::Home;
}

enum class Role : uint8_t
{
    Passer,
    Runner,
    Blocker,
    Unknown
};

enum class Race : uint8_t
{
    Human,
    Sylvan,
    Gryll,
    Lumina,
    Umbra,
    Unknown
};
inline constexpr size_t kRaceCount = 6;

// Fixed stat schema shared by base stats, bonuses and race deltas.
enum class Stat : uint8_t
{
    Speed,
    Power,
    Throwing,
    Catching,
    Kicking,
    Stamina,
    Agility,
    Leadership
};
inline constexpr size_t kStatCount = 8;

struct StatBlock
{
    std::array<double, kStatCount> v{};

    double &operator[](Stat s) noexcept { return v[static_cast<size_t>(s)]; }
    double operator[](Stat s) const noexcept { return v[static_cast<size_t>(s)]; }

    double speed() const noexcept { return (*this)[Stat::Speed]; }
    double power() const noexcept { return (*this)[Stat::Power]; }
    double throwing() const noexcept { return (*this)[Stat::Throwing]; }
    double catching() const noexcept { return (*this)[Stat::Catching]; }
    double kicking() const noexcept { return (*this)[Stat::Kicking]; }
    double agility() const noexcept { return (*this)[Stat::Agility]; }
};

enum class EventType : uint8_t
{
    RoutinePlay,
    Score,
    Turnover
};

// Declared in descending importance; the numeric value doubles as the metrics tier index.
enum class Priority : uint8_t
{
    Critical = 0,
    Important = 1,
    Standard = 2,
    Downtime = 3
};

enum class GamePhase : uint8_t
{
    Early,
    Middle,
    Late,
    Clutch
};

enum class ActionKind : uint8_t
{
    Run,
    Pass,
    Kick,
    Defense
};

std::string_view to_string(Side s) noexcept;
std::string_view to_string(Role r) noexcept;
std::string_view to_string(Race r) noexcept;
std::string_view to_string(Stat s) noexcept;
std::string_view to_string(EventType t) noexcept;
std::string_view to_string(Priority p) noexcept;
std::string_view to_string(GamePhase p) noexcept;
std::string_view to_string(ActionKind k) noexcept;

// Case-insensitive tag parsing; unrecognized tags map to the Unknown member.
Role parse_role(std::string_view tag) noexcept;
Race parse_race(std::string_view tag) noexcept;
// Empty optional for names outside the stat schema.
std::optional<Stat> parse_stat(std::string_view name) noexcept;

} // namespace dball::engine
