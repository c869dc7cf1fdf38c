/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_TPU_LEADER_CACHE_HPP
#define TPU_TURBO_TPU_LEADER_CACHE_HPP

#include <memory>
#include <tt/mutex.hpp>
#include <tt/solana/cluster.hpp>

namespace tpu_turbo::tpu {
    using solana::slot_t;
    using solana::pubkey;
    using solana::socket_address;

    static constexpr uint64_t max_fanout_slots = 100;
    static constexpr uint64_t default_fanout_slots = 12;

    struct leader_schedule {
        slot_t first_slot = 0;
        std::vector<pubkey> leaders {};

        slot_t last_slot() const
        {
            return first_slot + leaders.size() - 1;
        }
    };
    using schedule_ptr = std::shared_ptr<const leader_schedule>;
    using contact_map_ptr = std::shared_ptr<const solana::contact_map>;

    // The leader schedule for a contiguous slot range and the TPU addresses of the leaders.
    // There is a single writer; readers work with immutable snapshots that are replaced wholesale.
    struct leader_cache {
        static std::unique_ptr<leader_cache> load(solana::cluster &cluster, slot_t start_slot);
        static std::vector<pubkey> fetch_slot_leaders(solana::cluster &cluster, slot_t start_slot, uint64_t slots_in_epoch);
        static solana::contact_map fetch_contact_map(solana::cluster &cluster);

        leader_cache(slot_t first_slot, std::vector<pubkey> &&leaders, solana::contact_map &&contacts,
            uint64_t slots_in_epoch, slot_t last_epoch_info_slot);

        schedule_ptr schedule() const;
        contact_map_ptr contacts() const;
        uint64_t slots_in_epoch() const;
        slot_t last_epoch_info_slot() const;
        slot_t last_slot() const;
        std::optional<pubkey> leader_for_slot(slot_t slot) const;
        // Distinct addresses of the leaders of the first fanout_slots slots in schedule order.
        std::vector<socket_address> leader_sockets(uint64_t fanout_slots) const;

        void update_schedule(slot_t first_slot, std::vector<pubkey> &&leaders);
        void update_contact_map(solana::contact_map &&contacts);
        void update_epoch_info(uint64_t slots_in_epoch, slot_t reference_slot);
    private:
        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _mutex {};
        schedule_ptr _schedule;
        contact_map_ptr _contacts;
        uint64_t _slots_in_epoch;
        slot_t _last_epoch_info_slot;
    };
}

#endif // !TPU_TURBO_TPU_LEADER_CACHE_HPP
