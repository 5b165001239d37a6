#pragma once

#include "anomaly_scan/anomaly_types.h"
#include "anomaly_scan/compiled_matcher.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace anomaly_scan
{
    using PatternEntries = std::vector<std::pair<std::string, std::string>>; // regex -> category

    // Built-in (regex, category) table, in registration order
    const PatternEntries &default_pattern_table();

    // Parse a declarative pattern document into ordered entries. Accepts either
    //   { "<regex>": "<CATEGORY>", ... }
    // or the same mapping nested under "exception_patterns".
    // Throws PatternLoadError on malformed input or an invalid regex.
    PatternEntries parse_pattern_document(const std::string &document);

    // Owns the default and custom pattern layers. Every successful mutation
    // publishes a fresh immutable PatternSet; snapshots handed out earlier stay
    // valid. A failed mutation leaves the published snapshot untouched.
    class PatternRegistry
    {
    public:
        // 'builtin' is what load_defaults()/reset() install
        explicit PatternRegistry(PatternEntries builtin = default_pattern_table());

        PatternRegistry(const PatternRegistry &) = delete;
        PatternRegistry &operator=(const PatternRegistry &) = delete;

        // installs the built-in table; calling it again changes nothing
        // unless defaults were removed in between
        void load_defaults();

        // parse + validate + merge; the custom layer is replaced as a whole
        LoadResult load_custom(const std::string &document);
        LoadResult load_custom_file(const std::string &path);

        // union of defaults and 'custom', custom wins on identical source
        LoadResult merge(const PatternEntries &custom);

        // validate and add (or override) one custom pattern
        LoadResult add(const std::string &source, const std::string &category);

        // drops 'source' from both layers; false if it was not registered
        bool remove(const std::string &source);

        // drop every custom pattern
        void reset();

        std::vector<AnomalyPattern> list() const;
        PatternSetPtr snapshot() const;

        std::size_t default_count() const;
        std::size_t custom_count() const;

        // JSON document loadable by load_custom(), keys sorted
        std::string export_patterns(bool custom_only) const;

    private:
        static std::vector<AnomalyPattern> merged(const std::vector<AnomalyPattern> &defaults,
                                                  const std::vector<AnomalyPattern> &custom);
        // caller holds mtx_; throws PatternLoadError without touching state on failure
        void publish_locked(std::vector<AnomalyPattern> defaults, std::vector<AnomalyPattern> custom);

        std::vector<AnomalyPattern> builtin_patterns() const;

        const PatternEntries builtin_;
        mutable std::mutex mtx_;
        std::vector<AnomalyPattern> defaults_;
        std::vector<AnomalyPattern> custom_;
        PatternSetPtr current_;
        std::uint64_t version_;
        bool defaults_loaded_;
    };

} // namespace anomaly_scan
