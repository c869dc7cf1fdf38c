/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_TPU_DATAGRAM_SENDER_MOCK_HPP
#define TPU_TURBO_TPU_DATAGRAM_SENDER_MOCK_HPP

#include <set>
#include <tt/mutex.hpp>
#include <tt/tpu/datagram-sender.hpp>

namespace tpu_turbo::tpu {
    // Records every datagram instead of sending it; sends to the hosts in failing_hosts fail.
    struct datagram_sender_mock: datagram_sender {
        struct datagram {
            solana::socket_address target {};
            uint8_vector payload {};
        };

        std::set<std::string> failing_hosts {};

        std::vector<datagram> sent() const
        {
            mutex::scoped_lock lk { _mutex };
            return _sent;
        }
    private:
        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _mutex {};
        std::vector<datagram> _sent {};

        send_result_list _send_impl(const std::vector<solana::socket_address> &targets, const buffer &payload) override
        {
            send_result_list results {};
            mutex::scoped_lock lk { _mutex };
            for (const auto &target: targets) {
                auto &res = results.emplace_back(send_result { target });
                if (failing_hosts.contains(target.host)) {
                    res.error = fmt::format("mock send failure to {}", target);
                    continue;
                }
                _sent.emplace_back(datagram { target, uint8_vector { payload } });
            }
            return results;
        }
    };
}

#endif // !TPU_TURBO_TPU_DATAGRAM_SENDER_MOCK_HPP
