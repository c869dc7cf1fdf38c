/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tt/solana/cluster-mock.hpp>
#include <tt/tpu/connection.hpp>
#include <tt/tpu/datagram-sender-mock.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;
using namespace tpu_turbo::tpu;
using namespace std::chrono_literals;

namespace {
    pubkey test_id(const uint8_t fill)
    {
        pubkey id {};
        id.fill(fill);
        return id;
    }

    struct test_env {
        const pubkey leader = test_id(0xAA);
        solana::cluster_mock cluster { { leader }, { { leader, socket_address { "10.0.0.1", 8003 } } }, 1000 };
        std::unique_ptr<leader_service> leaders = leader_service::load(cluster, false, false);
        datagram_sender_mock sender {};
        client tpu_client { *leaders, {}, sender };
        connection conn { tpu_client, 200ms, 10ms };
        solana::keypair payer = [] {
            ed25519::seed sd {};
            sd.fill(0x42);
            return solana::keypair::from_seed(sd);
        }();

        solana::message message(const std::optional<uint8_t> version={}) const
        {
            solana::message msg {};
            msg.version = version;
            msg.header.num_required_signatures = 1;
            msg.header.num_readonly_unsigned_accounts = 1;
            msg.account_keys = { payer.public_key, pubkey {} };
            msg.recent_blockhash = test_id(0x77);
            auto &instr = msg.instructions.emplace_back();
            instr.program_id_index = 1;
            instr.accounts = uint8_vector::from_hex("00");
            return msg;
        }

        solana::legacy_transaction legacy() const
        {
            solana::legacy_transaction tx {};
            tx.msg = message();
            tx.sign({ payer });
            return tx;
        }

        solana::versioned_transaction versioned() const
        {
            const auto msg = message(0);
            return { { ed25519::sign(msg.serialize(), payer.secret) }, msg };
        }
    };
}

suite tpu_connection_suite = [] {
    "tpu::connection"_test = [] {
        "send_and_confirm_raw"_test = [] {
            test_env env {};
            const auto tx = env.legacy();
            env.cluster.set_status(tx.signatures.at(0), { 1001, solana::commitment::confirmed });
            test_same(tx.signatures.at(0), env.conn.send_and_confirm_raw(tx.serialize()));
            test_same(1, env.sender.sent().size());
        };
        "a higher commitment level satisfies a lower one"_test = [] {
            test_env env {};
            const auto tx = env.legacy();
            env.cluster.set_status(tx.signatures.at(0), { 1001, solana::commitment::finalized });
            test_same(tx.signatures.at(0), env.conn.send_and_confirm_raw(tx.serialize(), solana::commitment::confirmed));
        };
        "confirmation timeout"_test = [] {
            test_env env {};
            const auto tx = env.legacy();
            env.cluster.set_status(tx.signatures.at(0), { 1001, solana::commitment::processed });
            expect(throws<error>([&] { env.conn.send_and_confirm_raw(tx.serialize()); }));
            expect(env.cluster.calls.signature_statuses.load() > 1);
        };
        "failed transaction"_test = [] {
            test_env env {};
            const auto tx = env.legacy();
            env.cluster.set_status(tx.signatures.at(0), { 1001, solana::commitment::processed, R"({"InstructionError":[0,"Custom"]})" });
            expect(throws<transaction_failed_error>([&] { env.conn.send_and_confirm_raw(tx.serialize()); }));
        };
        "send_and_confirm signs legacy transactions"_test = [] {
            test_env env {};
            auto tx = env.legacy();
            tx.signatures.clear();
            // the client refreshes the blockhash before signing so the expected signature is computed the same way
            env.cluster.set_latest_blockhash({ test_id(0x99), 2000 });
            auto expected = tx;
            expected.msg.recent_blockhash = test_id(0x99);
            expected.sign({ env.payer });
            env.cluster.set_status(expected.signatures.at(0), { 1001, solana::commitment::confirmed });
            test_same(expected.signatures.at(0), env.conn.send_and_confirm(tx, { env.payer }));
        };
        "execute_and_confirm"_test = [] {
            test_env env {};
            const auto tx = env.versioned();
            env.cluster.set_status(tx.signatures.at(0), { 1001, solana::commitment::confirmed });
            const auto res = env.conn.execute_and_confirm(tx, { test_id(0x77), 3000 });
            expect(res.confirmed);
            test_same(tx.signatures.at(0), *res.signature);
            expect(!res.error);
        };
        "execute_and_confirm with an expired blockhash"_test = [] {
            test_env env {};
            const auto tx = env.versioned();
            env.cluster.set_block_height(3001);
            const auto res = env.conn.execute_and_confirm(tx, { test_id(0x77), 3000 });
            expect(!res.confirmed);
            test_same(tx.signatures.at(0), *res.signature);
            expect(res.error.has_value());
            test_same(1, env.cluster.calls.block_height.load());
        };
        "execute_and_confirm with a failed transaction"_test = [] {
            test_env env {};
            const auto tx = env.versioned();
            env.cluster.set_status(tx.signatures.at(0), { 1001, {}, R"({"InstructionError":[0,"Custom"]})" });
            const auto res = env.conn.execute_and_confirm(tx, { test_id(0x77), 3000 });
            expect(!res.confirmed);
            test_same(std::string { R"({"InstructionError":[0,"Custom"]})" }, *res.error);
        };
        "execute_and_confirm does not throw on send failures"_test = [] {
            test_env env {};
            env.sender.failing_hosts.emplace("10.0.0.1");
            const auto res = env.conn.execute_and_confirm(env.versioned(), { test_id(0x77), 3000 });
            expect(!res.confirmed);
            expect(!res.signature);
            expect(res.error.has_value());
        };
    };
};
