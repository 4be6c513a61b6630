// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-GAIA-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of GAIA (Adaptive Test Scheduler).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael

#include "scheduling/AdaptivePriorityQueue.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "scheduling/Scoring.h"
#include <algorithm>
#include <stdexcept>

namespace GAIA {

AdaptivePriorityQueue::AdaptivePriorityQueue(size_t maxSize) : maxSize_(maxSize) {
    if (maxSize_ == 0) {
        throw std::invalid_argument("AdaptivePriorityQueue requires a positive capacity");
    }
}

void AdaptivePriorityQueue::push(const TestItem &item, const GAIAState &state) {
    if (item.id.empty()) {
        throw std::invalid_argument("AdaptivePriorityQueue::push: item must have an id");
    }

    if (state.isTestCompleted(item.id)) {
        LOG_TRACE("AdaptivePriorityQueue: Skipping completed item '{}'", Log::sanitize(item.id));
        return;
    }

    QueueEntry entry;
    entry.score = computePriorityScore(item, state);
    entry.sequenceNumber = nextSequence_++;
    entry.item = item;

    heap_.push_back(std::move(entry));
    std::push_heap(heap_.begin(), heap_.end(), ScoreComparator{});
    ++idCounts_[item.id];

    if (heap_.size() > maxSize_) {
        trimToCapacity();
    }
}

std::optional<TestItem> AdaptivePriorityQueue::pop() {
    if (heap_.empty()) {
        return std::nullopt;
    }

    std::pop_heap(heap_.begin(), heap_.end(), ScoreComparator{});
    TestItem item = std::move(heap_.back().item);
    heap_.pop_back();
    forgetId(item.id);
    return item;
}

std::optional<TestItem> AdaptivePriorityQueue::peek() const {
    if (heap_.empty()) {
        return std::nullopt;
    }
    return heap_.front().item;
}

void AdaptivePriorityQueue::rescoreAll(const GAIAState &state) {
    std::vector<QueueEntry> entries;
    entries.swap(heap_);
    idCounts_.clear();

    // Re-push in original push order so equal scores keep their FIFO order
    std::sort(entries.begin(), entries.end(),
              [](const QueueEntry &a, const QueueEntry &b) { return a.sequenceNumber < b.sequenceNumber; });

    size_t before = entries.size();
    for (const auto &entry : entries) {
        push(entry.item, state);
    }

    LOG_DEBUG("AdaptivePriorityQueue: Rescored {} items, {} remain", before, heap_.size());
}

std::vector<TestItem> AdaptivePriorityQueue::getTopN(size_t n) const {
    std::vector<TestItem> items;
    for (auto &entry : getTopEntries(n)) {
        items.push_back(std::move(entry.item));
    }
    return items;
}

std::vector<ScoredItem> AdaptivePriorityQueue::getTopEntries(size_t n) const {
    std::vector<QueueEntry> sorted = sortedEntries();
    if (sorted.size() > n) {
        sorted.resize(n);
    }

    std::vector<ScoredItem> result;
    result.reserve(sorted.size());
    for (auto &entry : sorted) {
        result.push_back(ScoredItem{entry.score, std::move(entry.item)});
    }
    return result;
}

bool AdaptivePriorityQueue::contains(const std::string &itemId) const {
    return idCounts_.count(itemId) > 0;
}

bool AdaptivePriorityQueue::remove(const std::string &itemId) {
    if (!contains(itemId)) {
        return false;
    }

    heap_.erase(std::remove_if(heap_.begin(), heap_.end(),
                               [&itemId](const QueueEntry &entry) { return entry.item.id == itemId; }),
                heap_.end());
    std::make_heap(heap_.begin(), heap_.end(), ScoreComparator{});
    idCounts_.erase(itemId);
    return true;
}

void AdaptivePriorityQueue::clear() {
    heap_.clear();
    idCounts_.clear();
}

std::vector<AdaptivePriorityQueue::QueueEntry> AdaptivePriorityQueue::sortedEntries() const {
    std::vector<QueueEntry> sorted(heap_);
    std::sort(sorted.begin(), sorted.end(),
              [](const QueueEntry &a, const QueueEntry &b) { return ScoreComparator{}(b, a); });
    return sorted;
}

void AdaptivePriorityQueue::trimToCapacity() {
    std::vector<QueueEntry> sorted = sortedEntries();

    for (size_t i = maxSize_; i < sorted.size(); ++i) {
        LOG_DEBUG("AdaptivePriorityQueue: Evicting '{}' (score {}) over capacity {}",
                  Log::sanitize(sorted[i].item.id), sorted[i].score, maxSize_);
        forgetId(sorted[i].item.id);
    }
    sorted.resize(maxSize_);

    heap_ = std::move(sorted);
    std::make_heap(heap_.begin(), heap_.end(), ScoreComparator{});
}

void AdaptivePriorityQueue::forgetId(const std::string &itemId) {
    auto it = idCounts_.find(itemId);
    if (it == idCounts_.end()) {
        return;
    }
    if (--it->second == 0) {
        idCounts_.erase(it);
    }
}

}  // namespace GAIA
