// src/line_scanner.cpp
#include "anomaly_scan/line_scanner.h"

#include <ios>
#include <stdexcept>

namespace anomaly_scan
{
    bool TextLineSource::next_line(std::string &line)
    {
        if (pos_ >= text_.size())
            return false;

        std::size_t nl = text_.find('\n', pos_);
        if (nl == std::string_view::npos)
        {
            line.assign(text_.substr(pos_));
            pos_ = text_.size();
        }
        else
        {
            line.assign(text_.substr(pos_, nl - pos_));
            pos_ = nl + 1;
        }
        return true;
    }

    bool StreamLineSource::next_line(std::string &line)
    {
        if (std::getline(in_, line))
            return true;
        if (in_.bad())
            throw std::ios_base::failure("read error");
        return false;
    }

    std::string_view trim_line(std::string_view line)
    {
        static constexpr std::string_view ws = " \t\r\n\f\v";
        std::size_t first = line.find_first_not_of(ws);
        if (first == std::string_view::npos)
            return {};
        std::size_t last = line.find_last_not_of(ws);
        return line.substr(first, last - first + 1);
    }

    LineScanner::LineScanner(const PatternSet &patterns,
                             LineSource &source,
                             const CancellationToken *cancel,
                             std::size_t batch_size)
        : patterns_(patterns), source_(source), cancel_(cancel),
          batch_size_(batch_size == 0 ? 1 : batch_size)
    {
    }

    ScanStatus LineScanner::run(std::vector<AnomalyMatch> &out)
    {
        if (consumed_)
            throw std::logic_error("LineScanner: input already consumed");
        consumed_ = true;

        std::string raw;
        std::string line;
        while (true)
        {
            // cancellation is checked once per batch, not per line
            if (cancel_ && lines_read_ % batch_size_ == 0 && cancel_->is_cancelled())
                return ScanStatus::Cancelled;

            if (!source_.next_line(raw))
                break;
            ++lines_read_;

            std::string_view trimmed = trim_line(raw);
            if (trimmed.empty())
                continue;

            line.assign(trimmed);
            if (auto hit = patterns_.match(line))
            {
                out.push_back(AnomalyMatch{lines_read_, line, std::move(hit->category),
                                           std::move(hit->pattern_source), std::move(hit->matched_text)});
            }
        }
        return ScanStatus::Completed;
    }

    std::vector<AnomalyMatch> detect_text(const PatternSet &patterns, std::string_view text)
    {
        std::vector<AnomalyMatch> out;
        if (patterns.empty())
            return out;

        TextLineSource source(text);
        LineScanner scanner(patterns, source);
        scanner.run(out);
        return out;
    }

} // namespace anomaly_scan
