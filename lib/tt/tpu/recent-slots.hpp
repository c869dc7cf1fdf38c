/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_TPU_RECENT_SLOTS_HPP
#define TPU_TURBO_TPU_RECENT_SLOTS_HPP

#include <deque>
#include <tt/mutex.hpp>
#include <tt/solana/types.hpp>

namespace tpu_turbo::tpu {
    using solana::slot_t;

    // A bounded window of recently observed slots used to estimate the slot the cluster is at.
    struct recent_slots {
        static constexpr size_t max_recent_slots = 12;
        static constexpr slot_t max_slot_skip_distance = 48;

        explicit recent_slots(slot_t current_slot);

        void record(slot_t slot);
        // Throws empty_state_error when nothing has been recorded.
        slot_t estimate() const;
        size_t size() const;
    private:
        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _mutex {};
        std::deque<slot_t> _slots {};
    };
}

#endif // !TPU_TURBO_TPU_RECENT_SLOTS_HPP
