/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <vector>
#include <tt/tpu/recent-slots.hpp>

namespace tpu_turbo::tpu {
    recent_slots::recent_slots(const slot_t current_slot)
    {
        record(current_slot);
    }

    void recent_slots::record(const slot_t slot)
    {
        mutex::scoped_lock lk { _mutex };
        _slots.emplace_back(slot);
        while (_slots.size() > max_recent_slots)
            _slots.pop_front();
    }

    slot_t recent_slots::estimate() const
    {
        std::vector<slot_t> sorted {};
        {
            mutex::scoped_lock lk { _mutex };
            sorted.assign(_slots.begin(), _slots.end());
        }
        if (sorted.empty())
            throw empty_state_error("no recent slots have been recorded");
        std::sort(sorted.begin(), sorted.end());
        // the median shifted by the number of observations above it
        const auto max_index = sorted.size() - 1;
        const auto median_index = max_index / 2;
        const auto expected = sorted[median_index] + (max_index - median_index);
        const auto upper_bound = expected + max_slot_skip_distance;
        const auto it = std::upper_bound(sorted.begin(), sorted.end(), upper_bound);
        // sorted[median_index] <= upper_bound so it != sorted.begin()
        return *std::prev(it);
    }

    size_t recent_slots::size() const
    {
        mutex::scoped_lock lk { _mutex };
        return _slots.size();
    }
}
