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

#pragma once

#include "model/TestItem.h"
#include "scheduling/GAIAState.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace GAIA {

/**
 * @brief Queued item together with the score it was queued under
 */
struct ScoredItem {
    int score = 0;
    TestItem item;
};

/**
 * @brief Bounded max-priority queue of TestItems with state-driven rescoring
 *
 * Binary heap over (score, sequence). Higher score pops first; equal scores
 * pop in push order. Scores are computed once at push time against the state
 * passed in; call rescoreAll() after the state changed to reorder.
 *
 * Not thread-safe. Owned by a single AdaptiveScheduler.
 */
class AdaptivePriorityQueue {
public:
    static constexpr size_t DEFAULT_MAX_SIZE = 100;

    /**
     * @brief Construct with a capacity
     * @throws std::invalid_argument if maxSize is 0
     */
    explicit AdaptivePriorityQueue(size_t maxSize = DEFAULT_MAX_SIZE);

    /**
     * @brief Score and insert an item
     *
     * No-op when the item is already completed in state. When the queue
     * grows beyond capacity the lowest-ordered entries are evicted.
     *
     * @throws std::invalid_argument if item.id is empty
     */
    void push(const TestItem &item, const GAIAState &state);

    /**
     * @brief Remove and return the highest-priority item
     */
    std::optional<TestItem> pop();

    std::optional<TestItem> peek() const;

    /**
     * @brief Recompute every score against state and rebuild the heap
     *
     * Items completed since they were queued are dropped. Relative push order
     * is preserved for tie-breaking. O(n log n).
     */
    void rescoreAll(const GAIAState &state);

    /**
     * @brief Up to n items in pop order, without modifying the queue
     */
    std::vector<TestItem> getTopN(size_t n) const;

    /**
     * @brief Like getTopN() but with the queued scores
     */
    std::vector<ScoredItem> getTopEntries(size_t n) const;

    bool contains(const std::string &itemId) const;

    /**
     * @brief Remove every entry with the given id
     * @return true if at least one entry was removed
     */
    bool remove(const std::string &itemId);

    size_t size() const {
        return heap_.size();
    }

    bool empty() const {
        return heap_.empty();
    }

    size_t maxSize() const {
        return maxSize_;
    }

    void clear();

private:
    struct QueueEntry {
        int score = 0;
        uint64_t sequenceNumber = 0;  // FIFO ordering among equal scores
        TestItem item;
    };

    /**
     * @brief Heap comparator: true when a pops after b
     */
    struct ScoreComparator {
        bool operator()(const QueueEntry &a, const QueueEntry &b) const {
            if (a.score != b.score) {
                return a.score < b.score;
            }
            return a.sequenceNumber > b.sequenceNumber;
        }
    };

    std::vector<QueueEntry> sortedEntries() const;
    void trimToCapacity();
    void forgetId(const std::string &itemId);

    std::vector<QueueEntry> heap_;
    std::unordered_map<std::string, size_t> idCounts_;
    size_t maxSize_;
    uint64_t nextSequence_ = 0;
};

}  // namespace GAIA
