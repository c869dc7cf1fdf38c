/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tt/ed25519.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;

suite ed25519_suite = [] {
    "ed25519"_test = [] {
        "rfc8032 vector"_test = [] {
            const auto sd = ed25519::seed::from_hex("9D61B19DEFFD5A60BA844AF492EC2CC44449C5697B326919703BAC031CAE7F60");
            const auto [sk, vk] = ed25519::create_from_seed(sd);
            test_same(ed25519::vkey::from_hex("D75A980182B10AB7D54BFED3C964073A0EE172F3DAA62325AF021A68F707511A"), vk);
            const auto sig = ed25519::sign(buffer {}, sk);
            test_same(ed25519::signature::from_hex("E5564300C360AC729086E2CC806E828A84877F1EB8E5D974D873E065224901555FB8821590A33BACC61E39701CF9B46BD25BF5F0595BBE24655141438E7A100B"), sig);
            expect(ed25519::verify(sig, vk, buffer {}));
        };
        "sign-verify"_test = [] {
            const auto [sk1, vk1] = ed25519::create_from_seed(ed25519::seed::from_hex("0101010101010101010101010101010101010101010101010101010101010101"));
            const auto [sk2, vk2] = ed25519::create_from_seed(ed25519::seed::from_hex("0202020202020202020202020202020202020202020202020202020202020202"));
            expect(vk1 != vk2);
            const std::string msg1 { "message1" }, msg2 { "message2" };
            const auto sig11 = ed25519::sign(msg1, sk1);
            const auto sig12 = ed25519::sign(msg2, sk1);
            expect(sig11 != sig12);
            expect(ed25519::verify(sig11, vk1, msg1));
            expect(!ed25519::verify(sig11, vk2, msg1));
            expect(!ed25519::verify(sig11, vk1, msg2));
            expect(ed25519::verify(sig12, vk1, msg2));
        };
        "extract-vkey"_test = [] {
            const auto [sk, vk] = ed25519::create_from_seed(ed25519::seed::from_hex("0303030303030303030303030303030303030303030303030303030303030303"));
            test_same(vk, ed25519::extract_vk(sk));
        };
        "wrong sizes"_test = [] {
            expect(throws([] { ed25519::create_from_seed(uint8_vector(31)); }));
            expect(throws([] { ed25519::extract_vk(uint8_vector(32)); }));
        };
    };
};
