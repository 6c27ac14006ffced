// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "cid_cache_builder.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <boost/asio/post.hpp>

#include <rubicid/db/errors.hpp>
#include <rubicid/infra/common/bounded_buffer.hpp>
#include <rubicid/infra/common/ensure.hpp>
#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/common/progress.hpp>
#include <rubicid/infra/concurrency/signal_handler.hpp>

namespace rubicid::builder {

//! Hand-off item: an entry, or the end-of-slice marker sent by each producer once done
using QueuedEntry = std::optional<db::CidCacheEntry>;

db::TokenRange resolve_build_range(TokenLevel level, TokenNumber start, TokenNumber end) {
    const auto limit{level_limit(level)};
    ensure_pre_condition(limit.has_value(), [&] { return "invalid level " + std::to_string(level); });
    ensure_pre_condition(start >= 1, [] { return "start must be at least 1"; });
    const TokenNumber clamped_end{std::min(end, *limit)};
    ensure_pre_condition(start <= clamped_end, [&] {
        return "empty range: start " + std::to_string(start) + " end " + std::to_string(clamped_end);
    });
    return {level, start, clamped_end};
}

std::vector<db::TokenRange> split_range(const db::TokenRange& range, size_t parts) {
    std::vector<db::TokenRange> slices;
    const size_t count{range.count()};
    if (count == 0 || parts == 0) return slices;
    parts = std::min(parts, count);
    const size_t slice_size{count / parts};
    size_t remainder{count % parts};
    TokenNumber next{range.start};
    for (size_t i{0}; i < parts; ++i) {
        const size_t size{slice_size + (remainder > 0 ? 1 : 0)};
        if (remainder > 0) --remainder;
        const auto last{static_cast<TokenNumber>(next + size - 1)};
        slices.push_back({range.level, next, last});
        next = last + 1;
    }
    return slices;
}

CidCacheBuildResult CidCacheBuilder::build(const CidCacheBuildSettings& settings) {
    ensure_pre_condition(settings.num_workers > 0, [] { return "number of workers must be positive"; });
    ensure_pre_condition(settings.batch_size > 0, [] { return "batch size must be positive"; });
    ensure_pre_condition(settings.queue_size > 0, [] { return "queue size must be positive"; });

    CidCacheBuildResult result;
    result.range = resolve_build_range(settings.level, settings.start, settings.end);
    const auto slices{split_range(result.range, settings.num_workers)};

    std::ostringstream range_description;
    range_description << result.range;
    log::Info("CidCache: build started", {"range", range_description.str(),
                                          "workers", std::to_string(slices.size()),
                                          "batch_size", std::to_string(settings.batch_size),
                                          "queue_size", std::to_string(settings.queue_size)});

    BoundedBuffer<QueuedEntry> queue{settings.queue_size};
    ProgressMeter progress{result.range.count()};
    std::atomic_size_t added{0};
    std::atomic_size_t failed{0};
    std::vector<std::exception_ptr> producer_errors(slices.size());

    auto produce = [&](size_t index) {
        const auto& slice{slices[index]};
        try {
            const auto client{make_client_()};
            for (TokenNumber number{slice.start}; number <= slice.end && !SignalHandler::signalled(); ++number) {
                auto content{make_token_content({slice.level, number}).to_string()};
                std::string cid;
                try {
                    cid = client->add(content, settings.add_options);
                } catch (const ipfs::AddError& ex) {
                    ++failed;
                    progress.add();
                    log::Warning("CidCache: token skipped", {"level", std::to_string(slice.level),
                                                             "number", std::to_string(number),
                                                             "error", ex.what()});
                    continue;
                }
                ++added;
                progress.add();
                db::CidCacheEntry entry{std::move(cid), std::move(content), TokenKey{slice.level, number}};
                if (!queue.push_front(QueuedEntry{std::move(entry)})) {
                    return;  // writer gave up
                }
            }
        } catch (const std::exception& ex) {
            log::Error("CidCache: producer failed", {"slice", std::to_string(index), "error", ex.what()});
            producer_errors[index] = std::current_exception();
        }
        queue.push_front(QueuedEntry{});
    };

    concurrency::WorkerPool producers{slices.size()};
    for (size_t i{0}; i < slices.size(); ++i) {
        boost::asio::post(producers, [&produce, i]() { produce(i); });
    }

    auto stop_producers = [&]() {
        queue.terminate_and_release_all();
        producers.join();
    };

    std::vector<db::CidCacheEntry> batch;
    batch.reserve(settings.batch_size);
    auto commit = [&]() {
        if (batch.empty()) return;
        const auto outcome{writer_.commit_batch(batch)};
        result.inserted += outcome.inserted;
        result.already_present += outcome.already_present;
        log::Debug("CidCache: batch committed", {"size", std::to_string(batch.size()),
                                                 "inserted", std::to_string(outcome.inserted)});
        batch.clear();
    };

    try {
        size_t finished_producers{0};
        QueuedEntry item;
        while (finished_producers < slices.size() && queue.pop_back(&item)) {
            if (!item) {
                ++finished_producers;
                continue;
            }
            batch.push_back(std::move(*item));
            if (batch.size() >= settings.batch_size) {
                commit();
            }
            if (progress.report_due()) {
                log::Info("CidCache: building", progress.as_log_args());
            }
        }
        commit();
    } catch (const db::PersistenceError& ex) {
        log::Critical("CidCache: batch commit failed, rerun the range", {"range", range_description.str(),
                                                                         "error", ex.what()});
        stop_producers();
        throw;
    } catch (...) {
        stop_producers();
        throw;
    }
    producers.join();

    result.added = added;
    result.failed = failed;
    const bool interrupted{SignalHandler::signalled()};
    const auto producer_error{std::find_if(producer_errors.cbegin(), producer_errors.cend(),
                                           [](const auto& error) { return error != nullptr; })};
    result.completed = !interrupted && producer_error == producer_errors.cend() && result.failed == 0 &&
                       result.added == result.range.count();
    if (result.completed) {
        writer_.record_range(result.range, absl::ToUnixSeconds(absl::Now()));
    }

    log::Info("CidCache: build finished", {"range", range_description.str(),
                                           "added", std::to_string(result.added),
                                           "failed", std::to_string(result.failed),
                                           "inserted", std::to_string(result.inserted),
                                           "already_present", std::to_string(result.already_present),
                                           "completed", result.completed ? "true" : "false",
                                           "elapsed", ProgressMeter::format(progress.elapsed())});
    if (producer_error != producer_errors.cend()) {
        std::rethrow_exception(*producer_error);
    }
    return result;
}

}  // namespace rubicid::builder
