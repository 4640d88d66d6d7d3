// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "engine/match_event.hpp"
#include "engine/match_state.hpp"
#include "engine/race_modifiers.hpp"
#include "engine/rng.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dball::engine {

// Categorized phrase templates. Templates use named placeholders such as {runnerName} or {yards}.
class PhraseBank
{
public:
    // Compact bank covering every pool the generator asks for.
    static PhraseBank built_in();

    // Built-in bank overlaid with the pools found in a YAML mapping of pool name -> list of templates.
    // YAML::Exception propagates for unreadable or malformed files.
    static PhraseBank load(const std::string &path);

    const std::vector<std::string> *pool(const std::string &name) const;
    void set_pool(const std::string &name, std::vector<std::string> templates);
    size_t pool_count() const noexcept { return pools_.size(); }

private:
    std::map<std::string, std::vector<std::string>> pools_;
};

// Replaces {name} occurrences with values; placeholders without a value are left intact.
std::string substitute(std::string_view tmpl, const std::map<std::string, std::string> &values);

// Maps a resolved event and the state snapshot to a line of text. Consumes exactly one RNG draw
// per call and never touches simulation data.
class CommentaryGenerator
{
public:
    CommentaryGenerator(PhraseBank bank, const RaceTable &races) : bank_(std::move(bank)), races_(races) {}

    std::string render(const MatchEvent &ev, const MatchState &state, DeterministicRng &rng) const;

    // Candidate pools for an event, in merge order.
    std::vector<std::string> pools_for(const MatchEvent &ev, const MatchState &state) const;

    // Placeholder values available to templates for this event.
    std::map<std::string, std::string> placeholders(const MatchEvent &ev, const MatchState &state) const;

    const PhraseBank &bank() const noexcept { return bank_; }

private:
    PhraseBank bank_;
    RaceTable races_;
};

} // namespace dball::engine
