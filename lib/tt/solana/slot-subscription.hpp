/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_SOLANA_SLOT_SUBSCRIPTION_HPP
#define TPU_TURBO_SOLANA_SLOT_SUBSCRIPTION_HPP

#include <chrono>
#include <tt/asio.hpp>
#include <tt/solana/cluster.hpp>

namespace tpu_turbo::solana {
    // Keeps a slotsUpdatesSubscribe WebSocket session open and reconnects after failures.
    // The handler is called from the asio worker thread.
    struct slot_subscription: subscription {
        static constexpr std::chrono::seconds reconnect_delay { 1 };
        static constexpr std::chrono::seconds connect_timeout { 30 };

        explicit slot_subscription(const std::string &ws_url, const slot_update_handler &handler, asio::worker &asio_worker=asio::worker::get());
        ~slot_subscription() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !TPU_TURBO_SOLANA_SLOT_SUBSCRIPTION_HPP
