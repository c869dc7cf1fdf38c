/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_SOLANA_CLUSTER_MOCK_HPP
#define TPU_TURBO_SOLANA_CLUSTER_MOCK_HPP

#include <atomic>
#include <map>
#include <tt/mutex.hpp>
#include <tt/solana/cluster.hpp>

namespace tpu_turbo::solana {
    // An in-memory cluster for tests: each leader produces leader_slots consecutive slots in rotation.
    struct cluster_mock: cluster {
        static constexpr uint64_t leader_slots = 4;

        struct failures {
            std::atomic_bool epoch_info { false };
            std::atomic_bool cluster_nodes { false };
            std::atomic_bool slot_leaders { false };
            std::atomic_bool slot { false };
        };

        struct counters {
            std::atomic_size_t epoch_info { 0 };
            std::atomic_size_t cluster_nodes { 0 };
            std::atomic_size_t slot_leaders { 0 };
            std::atomic_size_t signature_statuses { 0 };
            std::atomic_size_t block_height { 0 };
        };

        failures fail {};
        counters calls {};

        cluster_mock(const std::vector<pubkey> &rotation, const contact_info_list &nodes, const slot_t current_slot=1000, const uint64_t slots_in_epoch=432000)
            : _rotation { rotation }, _nodes { nodes }, _current_slot { current_slot }, _slots_in_epoch { slots_in_epoch }
        {
            if (_rotation.empty())
                throw error("the leader rotation of a mock cluster cannot be empty");
        }

        pubkey leader_at(const slot_t slot) const
        {
            return _rotation[(slot / leader_slots) % _rotation.size()];
        }

        void set_current_slot(const slot_t slot)
        {
            mutex::scoped_lock lk { _mutex };
            _current_slot = slot;
        }

        void set_nodes(const contact_info_list &nodes)
        {
            mutex::scoped_lock lk { _mutex };
            _nodes = nodes;
        }

        void set_block_height(const uint64_t height)
        {
            mutex::scoped_lock lk { _mutex };
            _block_height = height;
        }

        void set_latest_blockhash(const blockhash_info &bh)
        {
            mutex::scoped_lock lk { _mutex };
            _blockhash = bh;
        }

        void set_status(const signature &sig, const signature_status &st)
        {
            mutex::scoped_lock lk { _mutex };
            _statuses[sig] = st;
        }

        // Delivers an update to the active subscriber; returns false when there is none.
        bool push(const slot_update &upd)
        {
            slot_update_handler handler {};
            {
                mutex::scoped_lock lk { _mutex };
                handler = _handler;
            }
            if (!handler)
                return false;
            handler(upd);
            return true;
        }
    private:
        struct mock_subscription: subscription {
            explicit mock_subscription(cluster_mock &c): _cluster { c }
            {
            }

            ~mock_subscription() override
            {
                mutex::scoped_lock lk { _cluster._mutex };
                _cluster._handler = {};
            }
        private:
            cluster_mock &_cluster;
        };

        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _mutex {};
        const std::vector<pubkey> _rotation;
        contact_info_list _nodes;
        slot_t _current_slot;
        uint64_t _slots_in_epoch;
        uint64_t _block_height = 0;
        blockhash_info _blockhash {};
        std::map<signature, signature_status> _statuses {};
        slot_update_handler _handler {};

        epoch_info _epoch_info_impl(commitment) override
        {
            ++calls.epoch_info;
            if (fail.epoch_info)
                throw error("mock getEpochInfo failure");
            mutex::scoped_lock lk { _mutex };
            return { _current_slot / _slots_in_epoch, _current_slot % _slots_in_epoch, _slots_in_epoch, _current_slot };
        }

        contact_info_list _cluster_nodes_impl() override
        {
            ++calls.cluster_nodes;
            if (fail.cluster_nodes)
                throw error("mock getClusterNodes failure");
            mutex::scoped_lock lk { _mutex };
            return _nodes;
        }

        std::vector<pubkey> _slot_leaders_impl(const slot_t start_slot, const uint64_t limit) override
        {
            ++calls.slot_leaders;
            if (fail.slot_leaders)
                throw error("mock getSlotLeaders failure");
            std::vector<pubkey> leaders {};
            leaders.reserve(limit);
            for (slot_t s = start_slot; s < start_slot + limit; ++s)
                leaders.emplace_back(leader_at(s));
            return leaders;
        }

        slot_t _slot_impl(commitment) override
        {
            if (fail.slot)
                throw error("mock getSlot failure");
            mutex::scoped_lock lk { _mutex };
            return _current_slot;
        }

        blockhash_info _latest_blockhash_impl(commitment) override
        {
            mutex::scoped_lock lk { _mutex };
            return _blockhash;
        }

        signature_status_list _signature_statuses_impl(const std::vector<signature> &sigs) override
        {
            ++calls.signature_statuses;
            signature_status_list res {};
            mutex::scoped_lock lk { _mutex };
            for (const auto &sig: sigs) {
                if (const auto it = _statuses.find(sig); it != _statuses.end())
                    res.emplace_back(it->second);
                else
                    res.emplace_back();
            }
            return res;
        }

        uint64_t _block_height_impl(commitment) override
        {
            ++calls.block_height;
            mutex::scoped_lock lk { _mutex };
            return _block_height;
        }

        std::unique_ptr<subscription> _subscribe_slot_updates_impl(const slot_update_handler &handler) override
        {
            mutex::scoped_lock lk { _mutex };
            _handler = handler;
            return std::make_unique<mock_subscription>(*this);
        }
    };
}

#endif // !TPU_TURBO_SOLANA_CLUSTER_MOCK_HPP
