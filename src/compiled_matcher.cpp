// src/compiled_matcher.cpp
#include "anomaly_scan/compiled_matcher.h"

#include <cctype>
#include <string>
#include <utility>

namespace anomaly_scan
{
    static constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase;

    void validate_pattern(const std::string &source)
    {
        if (source.empty())
            throw PatternLoadError(source, "empty regex pattern");

        try
        {
            std::regex probe(source, kRegexFlags);
        }
        catch (const std::regex_error &e)
        {
            throw PatternLoadError(source, "invalid regex pattern '" + source + "': " + e.what());
        }
    }

    std::string shift_backreferences(const std::string &source, std::size_t offset)
    {
        std::string out;
        out.reserve(source.size() + 8);

        bool in_class = false;
        for (std::size_t i = 0; i < source.size(); ++i)
        {
            char c = source[i];
            if (c == '\\' && i + 1 < source.size())
            {
                char next = source[i + 1];
                // \0 is the NUL escape, not a group reference
                if (!in_class && next >= '1' && next <= '9')
                {
                    std::size_t j = i + 1;
                    std::size_t n = 0;
                    while (j < source.size() && std::isdigit((unsigned char)source[j]))
                        n = n * 10 + (std::size_t)(source[j++] - '0');
                    out += '\\';
                    out += std::to_string(n + offset);
                    i = j - 1;
                    continue;
                }
                out += c;
                out += next;
                ++i;
                continue;
            }
            if (c == '[' && !in_class)
                in_class = true;
            else if (c == ']' && in_class)
                in_class = false;
            out += c;
        }
        return out;
    }

    CompiledMatcher::CompiledMatcher(const std::vector<AnomalyPattern> &patterns)
    {
        if (patterns.empty())
            return;

        std::string combined;
        std::size_t next_group = 1;
        alternatives_.reserve(patterns.size());

        for (std::size_t i = 0; i < patterns.size(); ++i)
        {
            const AnomalyPattern &p = patterns[i];

            std::regex single;
            try
            {
                single.assign(p.source, kRegexFlags);
            }
            catch (const std::regex_error &e)
            {
                throw PatternLoadError(p.source, "invalid regex pattern '" + p.source + "': " + e.what());
            }

            // inner group k of this pattern is group next_group + k in the combined regex
            if (i > 0)
                combined += '|';
            combined += '(';
            combined += shift_backreferences(p.source, next_group);
            combined += ')';

            std::size_t inner_groups = single.mark_count();
            alternatives_.push_back(Alternative{next_group, p.category, p.source, std::move(single)});
            next_group += 1 + inner_groups;
        }

        try
        {
            combined_.emplace(combined, kRegexFlags);
        }
        catch (const std::regex_error &e)
        {
            alternatives_.clear();
            throw PatternLoadError("", std::string("failed to build combined pattern: ") + e.what());
        }
    }

    std::optional<MatchHit> CompiledMatcher::match(const std::string &line) const
    {
        if (!combined_)
            return std::nullopt;

        std::smatch m;
        if (!std::regex_search(line, m, *combined_))
            return std::nullopt;

        std::size_t winner = 0;
        while (winner < alternatives_.size() && !m[alternatives_[winner].group].matched)
            ++winner;
        if (winner == alternatives_.size())
            return std::nullopt;

        // an earlier registered pattern may still occur to the right of the leftmost hit
        for (std::size_t i = 0; i < winner; ++i)
        {
            const Alternative &alt = alternatives_[i];
            std::smatch single;
            if (std::regex_search(line, single, alt.single))
                return MatchHit{alt.category, alt.source, single[0].str()};
        }

        const Alternative &alt = alternatives_[winner];
        return MatchHit{alt.category, alt.source, m[alt.group].str()};
    }

    PatternSet::PatternSet(std::vector<AnomalyPattern> patterns, std::uint64_t version)
        : patterns_(std::move(patterns)), matcher_(patterns_), version_(version)
    {
    }

} // namespace anomaly_scan
