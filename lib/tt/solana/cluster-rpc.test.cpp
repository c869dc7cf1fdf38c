/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tt/solana/cluster-rpc.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;
using namespace tpu_turbo::solana;

namespace {
    json::value parse_str(const std::string_view text)
    {
        return json::parse(buffer { text });
    }
}

suite solana_cluster_rpc_suite = [] {
    "solana::cluster_rpc"_test = [] {
        static const std::string id_a { "7Np41oeYqPefeNQEHSv1UDhYrehxin3NStELsSKCT4K2" };
        static const std::string id_b { "GdnSyH3YtwcxFvQrVVJMm1JhTS4QVX7MFsX56uJLUfiZ" };
        "request_body"_test = [] {
            const auto body = parse_str(rpc::request_body(7, "getSlotLeaders", { 100, 12 }));
            test_same(std::string { "2.0" }, std::string { body.at("jsonrpc").as_string() });
            test_same(7, json::value_to<uint64_t>(body.at("id")));
            test_same(std::string { "getSlotLeaders" }, std::string { body.at("method").as_string() });
            test_same(2, body.at("params").as_array().size());
            expect(!parse_str(rpc::request_body(1, "getClusterNodes", {})).as_object().contains("params"));
        };
        "result_of"_test = [] {
            const auto ok = parse_str(R"({"jsonrpc":"2.0","id":1,"result":12345})");
            test_same(12345, json::value_to<uint64_t>(rpc::result_of(ok, "getSlot")));
            const auto err = parse_str(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32602,"message":"Invalid params"}})");
            expect(throws<error>([&] { rpc::result_of(err, "getSlot"); }));
            const auto empty = parse_str(R"({"jsonrpc":"2.0","id":1})");
            expect(throws<error>([&] { rpc::result_of(empty, "getSlot"); }));
        };
        "epoch_info"_test = [] {
            const auto ei = rpc::parse_epoch_info(parse_str(
                R"({"absoluteSlot":166598,"blockHeight":166500,"epoch":27,"slotIndex":2790,"slotsInEpoch":8192,"transactionCount":22661093})"));
            test_same(27, ei.epoch);
            test_same(2790, ei.slot_index);
            test_same(8192, ei.slots_in_epoch);
            test_same(166598, ei.absolute_slot);
        };
        "cluster_nodes"_test = [&] {
            const auto nodes = rpc::parse_cluster_nodes(parse_str(fmt::format(
                R"([{{"gossip":"10.239.6.48:8001","pubkey":"{}","rpc":"10.239.6.48:8899","tpu":"10.239.6.48:8856","version":"1.0.0"}},)"
                R"({{"gossip":"10.239.6.49:8001","pubkey":"{}","rpc":null,"tpu":null,"version":"1.0.0"}}])", id_a, id_b)));
            test_same(2, nodes.size());
            test_same(base58::decode_fixed<32>(id_a), nodes[0].identity);
            expect(nodes[0].tpu == socket_address { "10.239.6.48", 8856 });
            test_same(base58::decode_fixed<32>(id_b), nodes[1].identity);
            expect(!nodes[1].tpu);
        };
        "cluster_nodes with an invalid tpu address"_test = [&] {
            const auto nodes = rpc::parse_cluster_nodes(parse_str(fmt::format(R"([{{"pubkey":"{}","tpu":"not-an-address"}}])", id_a)));
            test_same(1, nodes.size());
            expect(!nodes[0].tpu);
        };
        "slot_leaders"_test = [&] {
            const auto leaders = rpc::parse_slot_leaders(parse_str(fmt::format(R"(["{}","{}","{}"])", id_a, id_a, id_b)));
            test_same(3, leaders.size());
            test_same(leaders[0], leaders[1]);
            test_same(base58::decode_fixed<32>(id_b), leaders[2]);
            expect(throws([] { rpc::parse_slot_leaders(parse_str(R"(["not-base58!"])")); }));
        };
        "latest_blockhash"_test = [] {
            const auto bh = rpc::parse_latest_blockhash(parse_str(
                R"({"context":{"slot":2792},"value":{"blockhash":"EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N","lastValidBlockHeight":3090}})"));
            test_same(base58::decode_fixed<32>("EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N"), bh.hash);
            test_same(3090, bh.last_valid_block_height);
        };
        "signature_statuses"_test = [] {
            const auto st = rpc::parse_signature_statuses(parse_str(
                R"({"context":{"slot":82},"value":[{"slot":48,"confirmations":null,"err":null,"status":{"Ok":null},"confirmationStatus":"finalized"},null,)"
                R"({"slot":49,"confirmations":1,"err":{"InstructionError":[0,"Custom"]},"confirmationStatus":"processed"}]})"));
            test_same(3, st.size());
            expect(st[0].has_value());
            test_same(48, st[0]->slot);
            expect(st[0]->confirmation_status == commitment::finalized);
            expect(!st[0]->err);
            expect(!st[1]);
            expect(st[2]->confirmation_status == commitment::processed);
            expect(st[2]->err.has_value());
        };
        "slot_notification"_test = [] {
            const auto upd = rpc::parse_slot_notification(parse_str(
                R"({"jsonrpc":"2.0","method":"slotsUpdatesNotification","params":{"result":{"parent":75,"slot":76,"timestamp":1625081266243,"type":"completed"},"subscription":0}})"));
            expect(upd.has_value());
            test_same(76, upd->slot);
            expect(upd->type == slot_update_type::completed);
            test_same(77, upd->current_slot());
            const auto first = rpc::parse_slot_notification(parse_str(
                R"({"jsonrpc":"2.0","method":"slotsUpdatesNotification","params":{"result":{"slot":80,"timestamp":1,"type":"firstShredReceived"},"subscription":0}})"));
            test_same(80, first->current_slot());
            expect(!rpc::parse_slot_notification(parse_str(R"({"jsonrpc":"2.0","result":0,"id":1})")));
        };
        "construction"_test = [] {
            expect(throws([] { cluster_rpc { "https://api.mainnet-beta.solana.com" }; }));
            expect(nothrow([] { cluster_rpc { "http://127.0.0.1:8899" }; }));
        };
    };
};
