/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <unordered_set>
#include <tt/logger.hpp>
#include <tt/tpu/leader-cache.hpp>

namespace tpu_turbo::tpu {
    std::unique_ptr<leader_cache> leader_cache::load(solana::cluster &cluster, const slot_t start_slot)
    {
        const auto ei = cluster.get_epoch_info();
        auto leaders = fetch_slot_leaders(cluster, start_slot, ei.slots_in_epoch);
        auto contacts = fetch_contact_map(cluster);
        logger::info("loaded the leader schedule for slots {}-{} and {} cluster nodes",
            start_slot, start_slot + leaders.size() - 1, contacts.size());
        return std::make_unique<leader_cache>(start_slot, std::move(leaders), std::move(contacts), ei.slots_in_epoch, start_slot);
    }

    std::vector<pubkey> leader_cache::fetch_slot_leaders(solana::cluster &cluster, const slot_t start_slot, const uint64_t slots_in_epoch)
    {
        const auto fanout = std::min(2 * max_fanout_slots, slots_in_epoch);
        auto leaders = cluster.slot_leaders(start_slot, fanout);
        if (leaders.empty())
            throw error("the cluster returned an empty leader schedule for {} slots starting at {}", fanout, start_slot);
        return leaders;
    }

    solana::contact_map leader_cache::fetch_contact_map(solana::cluster &cluster)
    {
        solana::contact_map contacts {};
        for (auto &node: cluster.cluster_nodes())
            contacts[node.identity] = std::move(node.tpu);
        return contacts;
    }

    leader_cache::leader_cache(const slot_t first_slot, std::vector<pubkey> &&leaders, solana::contact_map &&contacts,
            const uint64_t slots_in_epoch, const slot_t last_epoch_info_slot)
        : _schedule { std::make_shared<const leader_schedule>(leader_schedule { first_slot, std::move(leaders) }) },
            _contacts { std::make_shared<solana::contact_map>(std::move(contacts)) },
            _slots_in_epoch { slots_in_epoch }, _last_epoch_info_slot { last_epoch_info_slot }
    {
        if (_schedule->leaders.empty())
            throw error("a leader schedule cannot be empty");
    }

    schedule_ptr leader_cache::schedule() const
    {
        mutex::scoped_lock lk { _mutex };
        return _schedule;
    }

    contact_map_ptr leader_cache::contacts() const
    {
        mutex::scoped_lock lk { _mutex };
        return _contacts;
    }

    uint64_t leader_cache::slots_in_epoch() const
    {
        mutex::scoped_lock lk { _mutex };
        return _slots_in_epoch;
    }

    slot_t leader_cache::last_epoch_info_slot() const
    {
        mutex::scoped_lock lk { _mutex };
        return _last_epoch_info_slot;
    }

    slot_t leader_cache::last_slot() const
    {
        return schedule()->last_slot();
    }

    std::optional<pubkey> leader_cache::leader_for_slot(const slot_t slot) const
    {
        const auto sched = schedule();
        if (slot < sched->first_slot || slot > sched->last_slot())
            return {};
        return sched->leaders[slot - sched->first_slot];
    }

    std::vector<socket_address> leader_cache::leader_sockets(const uint64_t fanout_slots) const
    {
        const auto sched = schedule();
        const auto cm = contacts();
        const auto num_slots = std::min(static_cast<size_t>(fanout_slots), sched->leaders.size());
        std::vector<socket_address> sockets {};
        std::unordered_set<pubkey> seen {};
        std::unordered_set<std::string> seen_addrs {};
        for (size_t i = 0; i < num_slots; ++i) {
            const auto &leader = sched->leaders[i];
            if (!seen.emplace(leader).second)
                continue;
            const auto it = cm->find(leader);
            if (it == cm->end() || !it->second) {
                logger::info("leader {} of slot {} has no known TPU address; skipping it", base58::encode(leader), sched->first_slot + i);
                continue;
            }
            // distinct leaders may publish the same TPU address
            if (!seen_addrs.emplace(it->second->to_string()).second)
                continue;
            sockets.emplace_back(*it->second);
        }
        return sockets;
    }

    void leader_cache::update_schedule(const slot_t first_slot, std::vector<pubkey> &&leaders)
    {
        if (leaders.empty())
            throw error("a leader schedule cannot be empty");
        auto sched = std::make_shared<const leader_schedule>(leader_schedule { first_slot, std::move(leaders) });
        mutex::scoped_lock lk { _mutex };
        _schedule = std::move(sched);
    }

    void leader_cache::update_contact_map(solana::contact_map &&contacts)
    {
        auto cm = std::make_shared<solana::contact_map>(std::move(contacts));
        mutex::scoped_lock lk { _mutex };
        _contacts = std::move(cm);
    }

    void leader_cache::update_epoch_info(const uint64_t slots_in_epoch, const slot_t reference_slot)
    {
        mutex::scoped_lock lk { _mutex };
        _slots_in_epoch = slots_in_epoch;
        _last_epoch_info_slot = reference_slot;
    }
}
