#pragma once

#include "anomaly_scan/anomaly_types.h"
#include "anomaly_scan/cancellation.h"
#include "anomaly_scan/compiled_matcher.h"

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace anomaly_scan
{
    // Forward-only line supplier
    class LineSource
    {
    public:
        virtual ~LineSource() = default;
        // false once the input is exhausted; throws std::ios_base::failure on a read error
        virtual bool next_line(std::string &line) = 0;
    };

    // Splits an in-memory blob on \n (a trailing \r is dropped later by trimming)
    class TextLineSource : public LineSource
    {
    public:
        explicit TextLineSource(std::string_view text) : text_(text) {}
        bool next_line(std::string &line) override;

    private:
        std::string_view text_;
        std::size_t pos_ = 0;
    };

    // Reads an open stream one line at a time
    class StreamLineSource : public LineSource
    {
    public:
        explicit StreamLineSource(std::istream &in) : in_(in) {}
        bool next_line(std::string &line) override;

    private:
        std::istream &in_;
    };

    // Strip surrounding whitespace (spaces, tabs, \r, \n, \f, \v)
    std::string_view trim_line(std::string_view line);

    // One forward pass of a PatternSet over a LineSource. Holds only the current
    // line; blank lines are skipped but still counted for numbering.
    class LineScanner
    {
    public:
        static constexpr std::size_t kDefaultBatchSize = 1024;

        // 'patterns' must outlive the scanner
        LineScanner(const PatternSet &patterns,
                    LineSource &source,
                    const CancellationToken *cancel = nullptr,
                    std::size_t batch_size = kDefaultBatchSize);

        // Appends hits to 'out'. Returns Cancelled if the token fired between
        // batches; matches found before that are kept. Throws std::logic_error
        // when called a second time.
        ScanStatus run(std::vector<AnomalyMatch> &out);

        std::size_t lines_read() const { return lines_read_; }

    private:
        const PatternSet &patterns_;
        LineSource &source_;
        const CancellationToken *cancel_;
        std::size_t batch_size_;
        std::size_t lines_read_ = 0;
        bool consumed_ = false;
    };

    // Classify a text blob line by line
    std::vector<AnomalyMatch> detect_text(const PatternSet &patterns, std::string_view text);

} // namespace anomaly_scan
