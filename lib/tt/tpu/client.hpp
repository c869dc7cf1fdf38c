/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_TPU_CLIENT_HPP
#define TPU_TURBO_TPU_CLIENT_HPP

#include <optional>
#include <tt/config.hpp>
#include <tt/solana/transaction.hpp>
#include <tt/tpu/datagram-sender.hpp>
#include <tt/tpu/leader-service.hpp>

namespace tpu_turbo::tpu {
    struct client_config {
        uint64_t fanout_slots = default_fanout_slots;

        // Reads the optional fanoutSlots element.
        static client_config from(const config &cfg);
    };

    // Fans a signed transaction out to the TPU addresses of the upcoming leaders.
    struct client {
        client(leader_service &leaders, const client_config &cfg={}, datagram_sender &sender=datagram_sender_udp::get());

        uint64_t fanout_slots() const
        {
            return _fanout_slots;
        }

        leader_service &leaders()
        {
            return _leaders;
        }

        // Returns the first signature of the transaction; throws only when no datagram could be sent.
        solana::signature send_raw(const buffer &raw_tx);
        // A versioned transaction must come already signed; a legacy one must come with its signers.
        solana::signature send(solana::transaction tx, const std::optional<solana::signer_list> &signers={});
    private:
        leader_service &_leaders;
        datagram_sender &_sender;
        const uint64_t _fanout_slots;
    };
}

#endif // !TPU_TURBO_TPU_CLIENT_HPP
