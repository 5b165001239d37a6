// src/pattern_registry.cpp
#include "anomaly_scan/pattern_registry.h"
#include "logging.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>

using ordered_json = nlohmann::ordered_json;

namespace anomaly_scan
{
    static void upsert(std::vector<AnomalyPattern> &dst, AnomalyPattern p)
    {
        auto it = std::find_if(dst.begin(), dst.end(),
                               [&](const AnomalyPattern &q) { return q.source == p.source; });
        if (it != dst.end())
            *it = std::move(p);
        else
            dst.push_back(std::move(p));
    }

    PatternEntries parse_pattern_document(const std::string &document)
    {
        ordered_json doc;
        try
        {
            doc = ordered_json::parse(document);
        }
        catch (const std::exception &e)
        {
            throw PatternLoadError("", std::string("malformed pattern document: ") + e.what());
        }

        if (!doc.is_object())
            throw PatternLoadError("", "pattern document must be a JSON object");

        const ordered_json *mapping = &doc;
        if (doc.contains("exception_patterns"))
        {
            mapping = &doc["exception_patterns"];
            if (!mapping->is_object())
                throw PatternLoadError("", "'exception_patterns' must be an object");
        }

        PatternEntries entries;
        entries.reserve(mapping->size());
        for (auto it = mapping->begin(); it != mapping->end(); ++it)
        {
            const std::string &source = it.key();
            if (!it.value().is_string())
                throw PatternLoadError(source, "category for '" + source + "' must be a string");

            std::string category = it.value().get<std::string>();
            if (category.empty())
                throw PatternLoadError(source, "empty category for '" + source + "'");

            validate_pattern(source);
            entries.emplace_back(source, std::move(category));
        }
        return entries;
    }

    PatternRegistry::PatternRegistry(PatternEntries builtin)
        : builtin_(std::move(builtin)), current_(std::make_shared<const PatternSet>()),
          version_(0), defaults_loaded_(false)
    {
    }

    std::vector<AnomalyPattern> PatternRegistry::builtin_patterns() const
    {
        std::vector<AnomalyPattern> out;
        for (const auto &[source, category] : builtin_)
            upsert(out, AnomalyPattern{source, category, PatternOrigin::Default});
        return out;
    }

    std::vector<AnomalyPattern> PatternRegistry::merged(const std::vector<AnomalyPattern> &defaults,
                                                        const std::vector<AnomalyPattern> &custom)
    {
        std::vector<AnomalyPattern> out = defaults;
        for (const auto &p : custom)
            upsert(out, p);
        return out;
    }

    void PatternRegistry::publish_locked(std::vector<AnomalyPattern> defaults, std::vector<AnomalyPattern> custom)
    {
        // compile first; nothing below runs if the combined regex cannot be built
        auto next = std::make_shared<const PatternSet>(merged(defaults, custom), version_ + 1);

        defaults_ = std::move(defaults);
        custom_ = std::move(custom);
        current_ = std::move(next);
        ++version_;
    }

    void PatternRegistry::load_defaults()
    {
        std::lock_guard<std::mutex> lock(mtx_);

        std::vector<AnomalyPattern> defaults = builtin_patterns();
        if (defaults_loaded_ && defaults == defaults_)
            return;

        publish_locked(std::move(defaults), custom_);
        defaults_loaded_ = true;
    }

    LoadResult PatternRegistry::load_custom(const std::string &document)
    {
        PatternEntries entries;
        try
        {
            entries = parse_pattern_document(document);
        }
        catch (const PatternLoadError &e)
        {
            log_error(std::string("pattern load rejected: ") + e.what());
            return LoadResult{false, 0, e.what(), e.entry()};
        }
        return merge(entries);
    }

    LoadResult PatternRegistry::load_custom_file(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            std::string msg = "cannot open pattern file: " + path;
            log_error(msg);
            return LoadResult{false, 0, msg, ""};
        }

        std::ostringstream buf;
        buf << in.rdbuf();
        LoadResult res = load_custom(buf.str());
        if (res.ok)
            log_message("Loaded " + std::to_string(res.count) + " custom patterns from " + path);
        return res;
    }

    LoadResult PatternRegistry::merge(const PatternEntries &custom)
    {
        std::vector<AnomalyPattern> next_custom;
        try
        {
            for (const auto &[source, category] : custom)
            {
                validate_pattern(source);
                if (category.empty())
                    throw PatternLoadError(source, "empty category for '" + source + "'");
                upsert(next_custom, AnomalyPattern{source, category, PatternOrigin::Custom});
            }

            std::lock_guard<std::mutex> lock(mtx_);
            publish_locked(defaults_, next_custom);
        }
        catch (const PatternLoadError &e)
        {
            log_error(std::string("pattern merge rejected: ") + e.what());
            return LoadResult{false, 0, e.what(), e.entry()};
        }

        std::size_t n = next_custom.size();
        return LoadResult{true, n, "Loaded " + std::to_string(n) + " custom patterns", ""};
    }

    LoadResult PatternRegistry::add(const std::string &source, const std::string &category)
    {
        try
        {
            if (category.empty())
                throw PatternLoadError(source, "both pattern and category are required");
            validate_pattern(source);

            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<AnomalyPattern> next_custom = custom_;
            upsert(next_custom, AnomalyPattern{source, category, PatternOrigin::Custom});
            publish_locked(defaults_, std::move(next_custom));
        }
        catch (const PatternLoadError &e)
        {
            log_error(std::string("add pattern rejected: ") + e.what());
            return LoadResult{false, 0, e.what(), e.entry()};
        }
        return LoadResult{true, 1, "Added pattern: " + source + " -> " + category, ""};
    }

    bool PatternRegistry::remove(const std::string &source)
    {
        std::lock_guard<std::mutex> lock(mtx_);

        auto same = [&](const AnomalyPattern &p) { return p.source == source; };
        std::vector<AnomalyPattern> next_defaults = defaults_;
        std::vector<AnomalyPattern> next_custom = custom_;
        auto removed = std::erase_if(next_defaults, same) + std::erase_if(next_custom, same);
        if (removed == 0)
            return false;

        try
        {
            publish_locked(std::move(next_defaults), std::move(next_custom));
        }
        catch (const PatternLoadError &e)
        {
            log_error(std::string("remove pattern failed: ") + e.what());
            return false;
        }
        return true;
    }

    void PatternRegistry::reset()
    {
        std::lock_guard<std::mutex> lock(mtx_);

        publish_locked(builtin_patterns(), {});
        defaults_loaded_ = true;
    }

    std::vector<AnomalyPattern> PatternRegistry::list() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return current_->patterns();
    }

    PatternSetPtr PatternRegistry::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return current_;
    }

    std::size_t PatternRegistry::default_count() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return defaults_.size();
    }

    std::size_t PatternRegistry::custom_count() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return custom_.size();
    }

    std::string PatternRegistry::export_patterns(bool custom_only) const
    {
        std::map<std::string, std::string> sorted;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (custom_only)
            {
                for (const auto &p : custom_)
                    sorted[p.source] = p.category;
            }
            else
            {
                for (const auto &p : current_->patterns())
                    sorted[p.source] = p.category;
            }
        }

        ordered_json mapping = ordered_json::object();
        for (const auto &[source, category] : sorted)
            mapping[source] = category;

        ordered_json doc;
        doc["exception_patterns"] = std::move(mapping);
        return doc.dump(2);
    }

} // namespace anomaly_scan
