/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tt/solana/cluster-mock.hpp>
#include <tt/tpu/client.hpp>
#include <tt/tpu/datagram-sender-mock.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;
using namespace tpu_turbo::tpu;

namespace {
    pubkey test_id(const uint8_t fill)
    {
        pubkey id {};
        id.fill(fill);
        return id;
    }

    solana::keypair test_keypair(const uint8_t fill)
    {
        ed25519::seed sd {};
        sd.fill(fill);
        return solana::keypair::from_seed(sd);
    }

    solana::message test_message(const pubkey &payer)
    {
        solana::message msg {};
        msg.header.num_required_signatures = 1;
        msg.header.num_readonly_unsigned_accounts = 1;
        msg.account_keys = { payer, test_id(0x11), pubkey {} };
        auto &instr = msg.instructions.emplace_back();
        instr.program_id_index = 2;
        instr.accounts = uint8_vector::from_hex("0001");
        instr.data = uint8_vector::from_hex("020000000a00000000000000");
        return msg;
    }

    struct test_env {
        const pubkey a = test_id(0xAA);
        const pubkey b = test_id(0xBB);
        solana::cluster_mock cluster {
            { a, b },
            { { a, socket_address { "10.0.0.1", 8003 } }, { b, socket_address { "10.0.0.2", 8003 } } },
            1000
        };
        std::unique_ptr<leader_service> leaders = leader_service::load(cluster, false, false);
        datagram_sender_mock sender {};
    };
}

suite tpu_client_suite = [] {
    "tpu::client"_test = [] {
        "fanout slots clamp"_test = [] {
            test_env env {};
            test_same(default_fanout_slots, client { *env.leaders, {}, env.sender }.fanout_slots());
            test_same(1, client { *env.leaders, client_config { 0 }, env.sender }.fanout_slots());
            test_same(max_fanout_slots, client { *env.leaders, client_config { 1000 }, env.sender }.fanout_slots());
            test_same(37, client { *env.leaders, client_config { 37 }, env.sender }.fanout_slots());
        };
        "config"_test = [] {
            test_same(5, client_config::from(config_json { json::object { { "fanoutSlots", 5 } } }).fanout_slots);
            test_same(default_fanout_slots, client_config::from(config_json { json::object { { "rpc", "http://127.0.0.1:8899" } } }).fanout_slots);
        };
        "send_raw legacy"_test = [] {
            test_env env {};
            client c { *env.leaders, {}, env.sender };
            const auto payer = test_keypair(1);
            solana::legacy_transaction tx {};
            tx.msg = test_message(payer.public_key);
            tx.sign({ payer });
            const auto raw = tx.serialize();
            test_same(tx.signatures.at(0), c.send_raw(raw));
            const auto sent = env.sender.sent();
            test_same(2, sent.size());
            expect(sent.at(0).target == socket_address { "10.0.0.1", 8003 });
            expect(sent.at(1).target == socket_address { "10.0.0.2", 8003 });
            test_same(raw, sent.at(0).payload);
        };
        "send_raw versioned"_test = [] {
            test_env env {};
            client c { *env.leaders, {}, env.sender };
            const auto payer = test_keypair(2);
            auto msg = test_message(payer.public_key);
            msg.version = 0;
            const auto sig = ed25519::sign(msg.serialize(), payer.secret);
            const solana::versioned_transaction tx { { sig }, msg };
            test_same(sig, c.send_raw(tx.serialize()));
            test_same(2, env.sender.sent().size());
        };
        "send_raw rejects malformed transactions"_test = [] {
            test_env env {};
            client c { *env.leaders, {}, env.sender };
            expect(throws([&] { c.send_raw(uint8_vector::from_hex("01")); }));
            test_same(0, env.sender.sent().size());
        };
        "partial and total send failures"_test = [] {
            test_env env {};
            client c { *env.leaders, {}, env.sender };
            const auto payer = test_keypair(3);
            solana::legacy_transaction tx {};
            tx.msg = test_message(payer.public_key);
            tx.sign({ payer });
            const auto raw = tx.serialize();
            env.sender.failing_hosts.emplace("10.0.0.1");
            test_same(tx.signatures.at(0), c.send_raw(raw));
            test_same(1, env.sender.sent().size());
            env.sender.failing_hosts.emplace("10.0.0.2");
            expect(throws<error>([&] { c.send_raw(raw); }));
        };
        "no reachable leaders"_test = [] {
            test_env env {};
            solana::cluster_mock cluster { { env.a }, { { env.a, {} } } };
            const auto leaders = leader_service::load(cluster, false, false);
            client c { *leaders, {}, env.sender };
            const auto payer = test_keypair(4);
            solana::legacy_transaction tx {};
            tx.msg = test_message(payer.public_key);
            tx.sign({ payer });
            expect(throws<error>([&] { c.send_raw(tx.serialize()); }));
        };
        "fanout limits the targets"_test = [] {
            test_env env {};
            client c { *env.leaders, client_config { 1 }, env.sender };
            const auto payer = test_keypair(5);
            solana::legacy_transaction tx {};
            tx.msg = test_message(payer.public_key);
            tx.sign({ payer });
            c.send_raw(tx.serialize());
            test_same(1, env.sender.sent().size());
        };
        "send legacy"_test = [] {
            test_env env {};
            const auto bh = blockhash::from_hex("0102030405060708091011121314151617181920212223242526272829303132");
            env.cluster.set_latest_blockhash({ bh, 5000 });
            client c { *env.leaders, {}, env.sender };
            const auto payer = test_keypair(6);
            solana::legacy_transaction tx {};
            tx.msg = test_message(payer.public_key);
            const auto sig = c.send(tx, solana::signer_list { payer });
            const auto sent = env.sender.sent();
            test_same(2, sent.size());
            const auto parsed = solana::parse_transaction(sent.at(0).payload);
            const auto &ltx = std::get<solana::legacy_transaction>(parsed);
            test_same(bh, ltx.msg.recent_blockhash);
            test_same(sig, ltx.signatures.at(0));
            expect(ed25519::verify(sig, payer.public_key, ltx.msg.serialize()));
        };
        "send legacy with a durable nonce"_test = [] {
            test_env env {};
            env.cluster.set_latest_blockhash({ blockhash::from_hex("0102030405060708091011121314151617181920212223242526272829303132"), 5000 });
            client c { *env.leaders, {}, env.sender };
            const auto payer = test_keypair(7);
            solana::legacy_transaction tx {};
            tx.msg = test_message(payer.public_key);
            tx.nonce = solana::nonce_info { blockhash::from_hex("abababababababababababababababababababababababababababababababab"), test_id(0x22), payer.public_key };
            c.send(tx, solana::signer_list { payer });
            const auto parsed = solana::parse_transaction(env.sender.sent().at(0).payload);
            const auto &ltx = std::get<solana::legacy_transaction>(parsed);
            test_same(tx.nonce->nonce, ltx.msg.recent_blockhash);
            test_same(2, ltx.msg.instructions.size());
            test_same(uint8_vector::from_hex("04000000"), ltx.msg.instructions.at(0).data);
        };
        "send argument checks"_test = [] {
            test_env env {};
            client c { *env.leaders, {}, env.sender };
            const auto payer = test_keypair(8);
            solana::legacy_transaction ltx {};
            ltx.msg = test_message(payer.public_key);
            expect(throws<invalid_arguments_error>([&] { c.send(ltx); }));
            expect(throws<invalid_arguments_error>([&] { c.send(ltx, solana::signer_list {}); }));
            auto msg = test_message(payer.public_key);
            msg.version = 0;
            const solana::versioned_transaction vtx { { ed25519::sign(msg.serialize(), payer.secret) }, msg };
            expect(throws<invalid_arguments_error>([&] { c.send(vtx, solana::signer_list { payer }); }));
            expect(throws<invalid_arguments_error>([&] { c.send(vtx, solana::signer_list {}); }));
            test_same(0, env.sender.sent().size());
            test_same(vtx.signatures.at(0), c.send(vtx));
        };
    };
};
