/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_SOLANA_CLUSTER_HPP
#define TPU_TURBO_SOLANA_CLUSTER_HPP

#include <functional>
#include <memory>
#include <tt/solana/types.hpp>

namespace tpu_turbo::solana {
    // A live push subscription; destroying it unsubscribes.
    struct subscription {
        virtual ~subscription() =default;
    };

    using slot_update_handler = std::function<void(const slot_update &)>;

    // The queries the leader tracking and confirmation logic needs from the cluster.
    struct cluster {
        virtual ~cluster() =default;

        epoch_info get_epoch_info(const commitment c=commitment::confirmed)
        {
            return _epoch_info_impl(c);
        }

        contact_info_list cluster_nodes()
        {
            return _cluster_nodes_impl();
        }

        std::vector<pubkey> slot_leaders(const slot_t start_slot, const uint64_t limit)
        {
            return _slot_leaders_impl(start_slot, limit);
        }

        slot_t slot(const commitment c=commitment::processed)
        {
            return _slot_impl(c);
        }

        blockhash_info latest_blockhash(const commitment c=commitment::confirmed)
        {
            return _latest_blockhash_impl(c);
        }

        signature_status_list signature_statuses(const std::vector<signature> &sigs)
        {
            return _signature_statuses_impl(sigs);
        }

        uint64_t block_height(const commitment c=commitment::confirmed)
        {
            return _block_height_impl(c);
        }

        // Returns an empty pointer when the cluster has no push endpoint.
        std::unique_ptr<subscription> subscribe_slot_updates(const slot_update_handler &handler)
        {
            return _subscribe_slot_updates_impl(handler);
        }
    private:
        virtual epoch_info _epoch_info_impl(commitment c) =0;
        virtual contact_info_list _cluster_nodes_impl() =0;
        virtual std::vector<pubkey> _slot_leaders_impl(slot_t start_slot, uint64_t limit) =0;
        virtual slot_t _slot_impl(commitment c) =0;
        virtual blockhash_info _latest_blockhash_impl(commitment c) =0;
        virtual signature_status_list _signature_statuses_impl(const std::vector<signature> &sigs) =0;
        virtual uint64_t _block_height_impl(commitment c) =0;

        virtual std::unique_ptr<subscription> _subscribe_slot_updates_impl(const slot_update_handler &/*handler*/)
        {
            return {};
        }
    };
}

#endif // !TPU_TURBO_SOLANA_CLUSTER_HPP
