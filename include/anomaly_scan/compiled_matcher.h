#pragma once

#include "anomaly_scan/anomaly_types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace anomaly_scan
{
    struct MatchHit
    {
        std::string category;
        std::string pattern_source;
        std::string matched_text;
    };

    // Throws PatternLoadError if 'source' is empty or does not compile as a
    // case-insensitive ECMAScript regex.
    void validate_pattern(const std::string &source);

    // Shifts numbered backreferences (\1, \12, ...) outside character classes
    // by 'offset', so the pattern keeps its meaning inside a larger expression.
    std::string shift_backreferences(const std::string &source, std::size_t offset);

    // All patterns folded into one case-insensitive regex (p1)|(p2)|...
    // searched once per line. The leftmost hit may belong to a later pattern
    // than one occurring further right, so only the patterns registered before
    // the winner are re-checked one by one. A line is attributed to the
    // earliest registered pattern that occurs anywhere in it.
    class CompiledMatcher
    {
    public:
        CompiledMatcher() = default;
        explicit CompiledMatcher(const std::vector<AnomalyPattern> &patterns);

        std::optional<MatchHit> match(const std::string &line) const;

        bool empty() const { return alternatives_.empty(); }
        std::size_t size() const { return alternatives_.size(); }

    private:
        struct Alternative
        {
            std::size_t group = 0; // capture group index in combined_
            std::string category;
            std::string source;
            std::regex single;     // the pattern alone, for the tie-break pass
        };

        std::optional<std::regex> combined_;
        std::vector<Alternative> alternatives_;
    };

    // Immutable pattern snapshot. Built once per registry mutation and shared
    // read-only by every scanner that captured it.
    class PatternSet
    {
    public:
        PatternSet() = default;
        PatternSet(std::vector<AnomalyPattern> patterns, std::uint64_t version);

        const std::vector<AnomalyPattern> &patterns() const { return patterns_; }
        const CompiledMatcher &matcher() const { return matcher_; }
        std::uint64_t version() const { return version_; }
        std::size_t size() const { return patterns_.size(); }
        bool empty() const { return patterns_.empty(); }

        std::optional<MatchHit> match(const std::string &line) const { return matcher_.match(line); }

    private:
        std::vector<AnomalyPattern> patterns_;
        CompiledMatcher matcher_;
        std::uint64_t version_ = 0;
    };

    using PatternSetPtr = std::shared_ptr<const PatternSet>;

} // namespace anomaly_scan
