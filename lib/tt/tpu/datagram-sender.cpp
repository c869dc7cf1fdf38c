/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifdef _MSC_VER
#   include <SDKDDKVer.h>
#endif
#include <future>
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio.hpp>
#include <tt/logger.hpp>
#include <tt/tpu/datagram-sender.hpp>

namespace tpu_turbo::tpu {
    namespace net = boost::asio;
    using udp = net::ip::udp;

    struct datagram_sender_udp::impl {
        explicit impl(asio::worker &asio_worker): _asio_worker { asio_worker }
        {
        }

        send_result_list send(const std::vector<solana::socket_address> &targets, const buffer &payload)
        {
            // the coroutines share the payload until all of them complete
            const auto data = std::make_shared<const uint8_vector>(payload);
            std::vector<std::future<void>> sends {};
            sends.reserve(targets.size());
            for (const auto &target: targets)
                sends.emplace_back(net::co_spawn(_asio_worker.io_context(), _send_one(target, data), net::use_future));
            send_result_list results {};
            results.reserve(targets.size());
            for (size_t i = 0; i < targets.size(); ++i) {
                auto &res = results.emplace_back(send_result { targets[i] });
                try {
                    sends[i].get();
                    logger::debug("sent {} bytes to {}", data->size(), targets[i]);
                } catch (const std::exception &ex) {
                    res.error = ex.what();
                    logger::warn("failed to send {} bytes to {}: {}", data->size(), targets[i], ex.what());
                }
            }
            return results;
        }
    private:
        asio::worker &_asio_worker;

        static net::awaitable<void> _send_one(const solana::socket_address target, const std::shared_ptr<const uint8_vector> data)
        {
            auto executor = co_await net::this_coro::executor;
            boost::system::error_code ec {};
            auto addr = net::ip::make_address(target.host, ec);
            udp::endpoint ep {};
            if (!ec) {
                ep = udp::endpoint { addr, target.port };
            } else {
                udp::resolver resolver { executor };
                const auto results = co_await resolver.async_resolve(target.host, std::to_string(target.port), net::use_awaitable);
                if (results.empty())
                    throw error("no addresses found for {}", target);
                ep = results.begin()->endpoint();
            }
            udp::socket socket { executor, ep.protocol() };
            co_await socket.async_send_to(net::buffer(data->data(), data->size()), ep, net::use_awaitable);
        }
    };

    datagram_sender_udp::datagram_sender_udp(asio::worker &asio_worker)
        : _impl { std::make_unique<impl>(asio_worker) }
    {
    }

    datagram_sender_udp::~datagram_sender_udp() =default;

    send_result_list datagram_sender_udp::_send_impl(const std::vector<solana::socket_address> &targets, const buffer &payload)
    {
        return _impl->send(targets, payload);
    }
}
