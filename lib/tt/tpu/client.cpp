/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <tt/logger.hpp>
#include <tt/tpu/client.hpp>

namespace tpu_turbo::tpu {
    client_config client_config::from(const config &cfg)
    {
        return { cfg.get<uint64_t>("fanoutSlots", default_fanout_slots) };
    }

    client::client(leader_service &leaders, const client_config &cfg, datagram_sender &sender)
        : _leaders { leaders }, _sender { sender },
            _fanout_slots { std::clamp(cfg.fanout_slots, uint64_t { 1 }, max_fanout_slots) }
    {
        if (_fanout_slots != cfg.fanout_slots)
            logger::warn("fanout slots {} is out of the supported range; using {}", cfg.fanout_slots, _fanout_slots);
    }

    solana::signature client::send_raw(const buffer &raw_tx)
    {
        const auto sig = solana::first_signature(raw_tx);
        const auto targets = _leaders.leader_sockets(_fanout_slots);
        if (targets.empty())
            throw error("transaction {}: no reachable leaders for the next {} slots", base58::encode(sig), _fanout_slots);
        const auto results = _sender.send(targets, raw_tx);
        std::vector<std::string> failed {};
        for (const auto &res: results) {
            if (!res)
                failed.emplace_back(fmt::format("{} ({})", res.target, *res.error));
        }
        if (failed.size() == results.size())
            throw error("transaction {}: all {} datagram sends failed: {}", base58::encode(sig), failed.size(), failed);
        logger::info("transaction {} sent to {} of {} leader addresses", base58::encode(sig), results.size() - failed.size(), results.size());
        return sig;
    }

    solana::signature client::send(solana::transaction tx, const std::optional<solana::signer_list> &signers)
    {
        if (auto *ltx = std::get_if<solana::legacy_transaction>(&tx); ltx) {
            if (!signers || signers->empty())
                throw invalid_arguments_error("a legacy transaction requires signers");
            if (!ltx->nonce)
                ltx->msg.recent_blockhash = _leaders.cluster().latest_blockhash().hash;
            ltx->sign(*signers);
        } else if (signers) {
            throw invalid_arguments_error("a versioned transaction must be signed before sending and does not take signers");
        }
        return send_raw(solana::serialize(tx));
    }
}
