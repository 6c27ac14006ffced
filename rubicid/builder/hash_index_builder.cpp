// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash_index_builder.hpp"

#include <algorithm>
#include <deque>
#include <future>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/asio/post.hpp>

#include <rubicid/core/common/random_number.hpp>
#include <rubicid/infra/common/ensure.hpp>
#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/common/progress.hpp>
#include <rubicid/infra/concurrency/signal_handler.hpp>

namespace rubicid::builder {

TokenNumber max_number_for_levels(const std::vector<TokenLevel>& levels) {
    ensure_pre_condition(!levels.empty(), [] { return "no level requested"; });
    TokenNumber max_number{0};
    for (const auto level : levels) {
        const auto limit{level_limit(level)};
        ensure_pre_condition(limit.has_value(), [&] { return "invalid level " + std::to_string(level); });
        max_number = std::max(max_number, *limit);
    }
    return max_number;
}

TokenNumber effective_last_number(const std::vector<TokenLevel>& levels, std::optional<TokenNumber> last_number) {
    const TokenNumber max_number{max_number_for_levels(levels)};
    if (!last_number) return max_number;
    ensure_pre_condition(*last_number > 0, [] { return "last number must be positive"; });
    return std::min(*last_number, max_number);
}

std::vector<db::HashIndexEntry> derive_hash_index_entries(TokenNumber first, TokenNumber last) {
    std::vector<db::HashIndexEntry> entries;
    entries.reserve(last - first + 1);
    for (TokenNumber number{first}; number <= last; ++number) {
        const auto level{highest_level_for(number)};
        ensure_invariant(level.has_value(), "token number outside every level");
        entries.push_back({token_hash(number), TokenKey{*level, number}});
    }
    return entries;
}

HashIndexBuildResult HashIndexBuilder::build(const HashIndexBuildSettings& settings) {
    const TokenNumber max_number{effective_last_number(settings.levels, settings.last_number)};
    ensure_pre_condition(settings.batch_size > 0, [] { return "batch size must be positive"; });
    ensure_pre_condition(settings.num_workers > 0, [] { return "number of workers must be positive"; });

    if (settings.force) {
        log::Warning("HashIndex: clearing existing entries");
        index_.clear();
    }

    HashIndexBuildResult result;
    result.watermark = index_.watermark();
    if (result.watermark >= max_number) {
        result.completed = true;
        log::Info("HashIndex: already built", {"watermark", std::to_string(result.watermark),
                                               "entries", std::to_string(index_.size())});
        return result;
    }
    result.first_number = result.watermark + 1;
    log::Info("HashIndex: build started", {"from", std::to_string(result.first_number),
                                           "to", std::to_string(max_number),
                                           "batch_size", std::to_string(settings.batch_size),
                                           "workers", std::to_string(settings.num_workers)});

    ProgressMeter progress{max_number - result.watermark};
    concurrency::WorkerPool workers{settings.num_workers};

    struct PendingBatch {
        TokenNumber last{0};
        std::future<std::vector<db::HashIndexEntry>> entries;
    };
    std::deque<PendingBatch> window;
    TokenNumber next_number{result.first_number};

    auto schedule = [&]() {
        const TokenNumber first{next_number};
        const TokenNumber last{static_cast<TokenNumber>(std::min<uint64_t>(uint64_t{first} + settings.batch_size - 1,
                                                                           max_number))};
        std::packaged_task<std::vector<db::HashIndexEntry>()> task{[first, last]() {
            return derive_hash_index_entries(first, last);
        }};
        window.push_back({last, task.get_future()});
        boost::asio::post(workers, std::move(task));
        next_number = last + 1;
    };

    // Keep every worker busy while batches are committed strictly in number order
    try {
        while (!window.empty() || next_number <= max_number) {
            while (window.size() < settings.num_workers * 2 && next_number <= max_number && !SignalHandler::signalled()) {
                schedule();
            }
            if (window.empty()) break;

            auto batch{std::move(window.front())};
            window.pop_front();
            const auto entries{batch.entries.get()};
            index_.put_batch(entries, batch.last);
            result.watermark = batch.last;
            result.written += entries.size();
            progress.add(entries.size());

            if (progress.report_due()) {
                auto args{progress.as_log_args()};
                args.insert(args.begin(), {"watermark", std::to_string(result.watermark)});
                log::Info("HashIndex: building", args);
            }
        }
    } catch (...) {
        workers.stop();
        workers.join();
        throw;
    }
    workers.join();

    result.completed = result.watermark >= max_number;
    if (result.completed) {
        log::Info("HashIndex: build completed", {"written", std::to_string(result.written),
                                                 "entries", std::to_string(index_.size()),
                                                 "elapsed", ProgressMeter::format(progress.elapsed())});
    } else {
        log::Warning("HashIndex: build interrupted", {"watermark", std::to_string(result.watermark),
                                                      "written", std::to_string(result.written)});
    }
    return result;
}

bool HashIndexBuilder::check_entry(TokenNumber number, HashIndexVerifyReport& report) {
    ++report.checked;
    const TokenKey expected{*highest_level_for(number), number};
    const auto stored{index_.lookup(token_hash(number))};
    if (!stored) {
        ++report.missing;
        log::Warning("HashIndex: missing entry", {"number", std::to_string(number)});
        return false;
    }
    if (*stored != expected) {
        ++report.mismatched;
        std::ostringstream stored_key;
        stored_key << *stored;
        log::Warning("HashIndex: mismatched entry", {"number", std::to_string(number), "stored", stored_key.str()});
        return false;
    }
    return true;
}

HashIndexVerifyReport HashIndexBuilder::verify(const HashIndexVerifySettings& settings) {
    const TokenNumber max_number{effective_last_number(settings.levels, settings.last_number)};

    HashIndexVerifyReport report;
    report.entries = index_.size();
    report.expected_entries = max_number;

    if (settings.full) {
        ProgressMeter progress{max_number};
        for (TokenNumber number{1}; number <= max_number && !SignalHandler::signalled(); ++number) {
            check_entry(number, report);
            progress.add();
            if (progress.report_due()) {
                log::Info("HashIndex: verifying", progress.as_log_args());
            }
        }
    } else {
        std::set<TokenNumber> numbers;
        if (kReferenceTokenNumber <= max_number) {
            numbers.insert(kReferenceTokenNumber);
        }
        numbers.insert(1);
        for (const auto level : settings.levels) {
            numbers.insert(std::min(*level_limit(level), max_number));
        }
        const uint64_t seed{settings.seed.value_or(std::random_device{}())};
        log::Debug("HashIndex: sampling", {"size", std::to_string(settings.sample_size), "seed", std::to_string(seed)});
        RandomNumber random_number{1, max_number, seed};
        for (size_t i{0}; i < settings.sample_size; ++i) {
            numbers.insert(static_cast<TokenNumber>(random_number.generate_one()));
        }
        for (const auto number : numbers) {
            check_entry(number, report);
        }
    }

    log::Info("HashIndex: verification done", {"checked", std::to_string(report.checked),
                                               "missing", std::to_string(report.missing),
                                               "mismatched", std::to_string(report.mismatched),
                                               "entries", std::to_string(report.entries),
                                               "expected", std::to_string(report.expected_entries)});
    return report;
}

}  // namespace rubicid::builder
