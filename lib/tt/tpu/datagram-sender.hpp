/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_TPU_DATAGRAM_SENDER_HPP
#define TPU_TURBO_TPU_DATAGRAM_SENDER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <tt/asio.hpp>
#include <tt/solana/types.hpp>

namespace tpu_turbo::tpu {
    struct send_result {
        solana::socket_address target {};
        std::optional<std::string> error {};

        explicit operator bool() const
        {
            return !static_cast<bool>(error);
        }
    };
    using send_result_list = std::vector<send_result>;

    // Sends one datagram per target and reports the outcome of every send in the order of targets.
    struct datagram_sender {
        virtual ~datagram_sender() =default;

        send_result_list send(const std::vector<solana::socket_address> &targets, const buffer &payload)
        {
            return _send_impl(targets, payload);
        }
    private:
        virtual send_result_list _send_impl(const std::vector<solana::socket_address> &targets, const buffer &payload) =0;
    };

    struct datagram_sender_udp: datagram_sender {
        static datagram_sender_udp &get()
        {
            static datagram_sender_udp sender {};
            return sender;
        }

        explicit datagram_sender_udp(asio::worker &asio_worker=asio::worker::get());
        ~datagram_sender_udp() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        send_result_list _send_impl(const std::vector<solana::socket_address> &targets, const buffer &payload) override;
    };
}

#endif // !TPU_TURBO_TPU_DATAGRAM_SENDER_HPP
