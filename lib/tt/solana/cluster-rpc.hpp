/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_SOLANA_CLUSTER_RPC_HPP
#define TPU_TURBO_SOLANA_CLUSTER_RPC_HPP

#include <chrono>
#include <optional>
#include <tt/asio.hpp>
#include <tt/json.hpp>
#include <tt/solana/cluster.hpp>

namespace tpu_turbo::solana::rpc {
    extern std::string request_body(uint64_t id, std::string_view method, const json::array &params);
    // Returns the result member of a JSON-RPC response and throws if the response carries an error.
    extern const json::value &result_of(const json::value &resp, std::string_view method);

    extern epoch_info parse_epoch_info(const json::value &res);
    extern contact_info_list parse_cluster_nodes(const json::value &res);
    extern std::vector<pubkey> parse_slot_leaders(const json::value &res);
    extern blockhash_info parse_latest_blockhash(const json::value &res);
    extern signature_status_list parse_signature_statuses(const json::value &res);
    // Empty for messages that are not slot update notifications such as subscription confirmations.
    extern std::optional<slot_update> parse_slot_notification(const json::value &msg);
}

namespace tpu_turbo::solana {
    struct cluster_rpc: cluster {
        static constexpr std::chrono::seconds default_timeout { 30 };

        explicit cluster_rpc(const std::string &rpc_url, const std::optional<std::string> &ws_url={},
            std::chrono::seconds timeout=default_timeout, asio::worker &asio_worker=asio::worker::get());
        ~cluster_rpc() override;

        json::value call(std::string_view method, const json::array &params={});
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        epoch_info _epoch_info_impl(commitment c) override;
        contact_info_list _cluster_nodes_impl() override;
        std::vector<pubkey> _slot_leaders_impl(slot_t start_slot, uint64_t limit) override;
        slot_t _slot_impl(commitment c) override;
        blockhash_info _latest_blockhash_impl(commitment c) override;
        signature_status_list _signature_statuses_impl(const std::vector<signature> &sigs) override;
        uint64_t _block_height_impl(commitment c) override;
        std::unique_ptr<subscription> _subscribe_slot_updates_impl(const slot_update_handler &handler) override;
    };
}

#endif // !TPU_TURBO_SOLANA_CLUSTER_RPC_HPP
