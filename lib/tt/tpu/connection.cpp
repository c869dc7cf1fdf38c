/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <thread>
#include <tt/logger.hpp>
#include <tt/tpu/connection.hpp>

namespace tpu_turbo::tpu {
    connection::connection(client &tpu_client, const std::chrono::milliseconds confirm_timeout, const std::chrono::milliseconds poll_interval)
        : _client { tpu_client }, _confirm_timeout { confirm_timeout }, _poll_interval { poll_interval }
    {
    }

    solana::signature connection::send_and_confirm_raw(const buffer &raw_tx, const solana::commitment c)
    {
        return _confirm(_client.send_raw(raw_tx), c);
    }

    solana::signature connection::send_and_confirm(solana::transaction tx, const solana::signer_list &signers, const solana::commitment c)
    {
        return _confirm(_client.send(std::move(tx), signers), c);
    }

    execute_result connection::execute_and_confirm(const solana::versioned_transaction &tx, const solana::blockhash_info &latest, const solana::commitment c)
    {
        execute_result res {};
        try {
            logger::debug("executing a transaction valid until block height {}", latest.last_valid_block_height);
            res.signature = _client.send_raw(tx.serialize());
            auto &cluster = _client.leaders().cluster();
            const auto st = _await_status(*res.signature, c, [&] {
                return cluster.block_height(c) > latest.last_valid_block_height;
            });
            if (!st) {
                res.error = fmt::format("the blockhash expired at block height {} before the transaction was confirmed", latest.last_valid_block_height);
            } else if (st->err) {
                res.error = *st->err;
            } else {
                res.confirmed = true;
            }
        } catch (const std::exception &ex) {
            res.error = ex.what();
        }
        if (!res.confirmed)
            logger::warn("transaction {} was not confirmed: {}", res.signature ? base58::encode(*res.signature) : std::string { "<unsent>" }, *res.error);
        return res;
    }

    std::optional<solana::signature_status> connection::_await_status(const solana::signature &sig, const solana::commitment c, const expiry_check &expired)
    {
        auto &cluster = _client.leaders().cluster();
        const std::vector<solana::signature> sigs { sig };
        for (;;) {
            try {
                const auto statuses = cluster.signature_statuses(sigs);
                if (!statuses.empty() && statuses.front()) {
                    const auto &st = *statuses.front();
                    if (st.err || (st.confirmation_status && *st.confirmation_status >= c))
                        return st;
                }
            } catch (const std::exception &ex) {
                logger::warn("signature status query for {} failed: {}", base58::encode(sig), ex.what());
            }
            if (expired())
                return {};
            std::this_thread::sleep_for(_poll_interval);
        }
    }

    solana::signature connection::_confirm(const solana::signature &sig, const solana::commitment c)
    {
        const auto deadline = std::chrono::steady_clock::now() + _confirm_timeout;
        const auto st = _await_status(sig, c, [&] {
            return std::chrono::steady_clock::now() >= deadline;
        });
        if (!st)
            throw error("transaction {} was not confirmed at the {} level within {} ms", base58::encode(sig), c, _confirm_timeout.count());
        if (st->err)
            throw transaction_failed_error("transaction {} failed: {}", base58::encode(sig), *st->err);
        logger::info("transaction {} reached the {} commitment level in slot {}", base58::encode(sig), c, st->slot);
        return sig;
    }
}
