/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio.hpp>
#include <tt/tpu/datagram-sender.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;
using namespace tpu_turbo::tpu;

suite tpu_datagram_sender_suite = [] {
    "tpu::datagram_sender"_test = [] {
        "udp to localhost"_test = [] {
            using udp = boost::asio::ip::udp;
            boost::asio::io_context ioc {};
            udp::socket receiver { ioc, udp::endpoint { boost::asio::ip::make_address("127.0.0.1"), 0 } };
            const solana::socket_address target { "127.0.0.1", receiver.local_endpoint().port() };
            const auto payload = uint8_vector::from_hex("DEADBEEF0102030405");
            auto &sender = datagram_sender_udp::get();
            const auto results = sender.send({ target, target }, payload);
            test_same(2, results.size());
            for (const auto &res: results) {
                expect(static_cast<bool>(res)) << res.error.value_or("");
                expect(res.target == target);
            }
            for (size_t i = 0; i < 2; ++i) {
                std::array<uint8_t, 64> buf {};
                udp::endpoint from {};
                const auto sz = receiver.receive_from(boost::asio::buffer(buf), from);
                test_same(payload, buffer { buf.data(), sz });
            }
        };
        "no targets"_test = [] {
            test_same(0, datagram_sender_udp::get().send({}, uint8_vector::from_hex("00")).size());
        };
    };
};
