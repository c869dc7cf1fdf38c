/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_TPU_CONNECTION_HPP
#define TPU_TURBO_TPU_CONNECTION_HPP

#include <chrono>
#include <functional>
#include <tt/tpu/client.hpp>

namespace tpu_turbo::tpu {
    struct execute_result {
        bool confirmed = false;
        std::optional<solana::signature> signature {};
        std::optional<std::string> error {};
    };

    // Sends through the TPU client and confirms through the cluster's signature status queries.
    struct connection {
        static constexpr std::chrono::seconds default_confirm_timeout { 60 };
        static constexpr std::chrono::milliseconds default_poll_interval { 500 };

        explicit connection(client &tpu_client, std::chrono::milliseconds confirm_timeout=default_confirm_timeout,
            std::chrono::milliseconds poll_interval=default_poll_interval);

        // Throws transaction_failed_error when the cluster reports a failure and error on a confirmation timeout.
        solana::signature send_and_confirm_raw(const buffer &raw_tx, solana::commitment c=solana::commitment::confirmed);
        solana::signature send_and_confirm(solana::transaction tx, const solana::signer_list &signers,
            solana::commitment c=solana::commitment::confirmed);
        // Waits until the transaction is confirmed or the block height passes the blockhash's last valid height.
        execute_result execute_and_confirm(const solana::versioned_transaction &tx, const solana::blockhash_info &latest,
            solana::commitment c=solana::commitment::confirmed);
    private:
        using expiry_check = std::function<bool()>;

        client &_client;
        const std::chrono::milliseconds _confirm_timeout;
        const std::chrono::milliseconds _poll_interval;

        std::optional<solana::signature_status> _await_status(const solana::signature &sig, solana::commitment c, const expiry_check &expired);
        solana::signature _confirm(const solana::signature &sig, solana::commitment c);
    };
}

#endif // !TPU_TURBO_TPU_CONNECTION_HPP
