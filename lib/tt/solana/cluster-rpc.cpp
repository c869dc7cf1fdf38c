/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifdef _MSC_VER
#   include <SDKDDKVer.h>
#endif
#include <atomic>
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <tt/logger.hpp>
#include <tt/solana/cluster-rpc.hpp>
#include <tt/solana/slot-subscription.hpp>

namespace tpu_turbo::solana::rpc {
    std::string request_body(const uint64_t id, const std::string_view method, const json::array &params)
    {
        json::object req {
            { "jsonrpc", "2.0" },
            { "id", id },
            { "method", method }
        };
        if (!params.empty())
            req.emplace("params", params);
        return json::serialize(req);
    }

    const json::value &result_of(const json::value &resp, const std::string_view method)
    {
        const auto &obj = resp.as_object();
        if (const auto *err = obj.if_contains("error"); err && !err->is_null()) {
            if (err->is_object()) {
                const auto &err_obj = err->as_object();
                const auto *msg = err_obj.if_contains("message");
                throw error("RPC {} failed with code {}: {}", method,
                    err_obj.contains("code") ? json::serialize(err_obj.at("code")) : std::string { "unknown" },
                    msg && msg->is_string() ? std::string { msg->as_string() } : json::serialize(*err));
            }
            throw error("RPC {} failed: {}", method, json::serialize(*err));
        }
        const auto *res = obj.if_contains("result");
        if (!res)
            throw error("RPC {} response has no result: {}", method, json::serialize(resp));
        return *res;
    }

    epoch_info parse_epoch_info(const json::value &res)
    {
        const auto &obj = res.as_object();
        return {
            json::value_to<uint64_t>(obj.at("epoch")),
            json::value_to<uint64_t>(obj.at("slotIndex")),
            json::value_to<uint64_t>(obj.at("slotsInEpoch")),
            json::value_to<uint64_t>(obj.at("absoluteSlot"))
        };
    }

    contact_info_list parse_cluster_nodes(const json::value &res)
    {
        contact_info_list nodes {};
        for (const auto &node_v: res.as_array()) {
            const auto &node = node_v.as_object();
            auto &ci = nodes.emplace_back(contact_info { base58::decode_fixed<32>(json::string_at(node, "pubkey")) });
            if (const auto tpu = json::optional_string_at(node, "tpu"); tpu && !tpu->empty()) {
                try {
                    ci.tpu = socket_address::from_string(*tpu);
                } catch (const error &ex) {
                    logger::debug("ignoring the TPU address of {}: {}", base58::encode(ci.identity), ex.what());
                }
            }
        }
        return nodes;
    }

    std::vector<pubkey> parse_slot_leaders(const json::value &res)
    {
        std::vector<pubkey> leaders {};
        const auto &arr = res.as_array();
        leaders.reserve(arr.size());
        for (const auto &id: arr)
            leaders.emplace_back(base58::decode_fixed<32>(static_cast<std::string_view>(id.as_string())));
        return leaders;
    }

    blockhash_info parse_latest_blockhash(const json::value &res)
    {
        const auto &val = res.at("value").as_object();
        return {
            base58::decode_fixed<32>(json::string_at(val, "blockhash")),
            json::value_to<uint64_t>(val.at("lastValidBlockHeight"))
        };
    }

    signature_status_list parse_signature_statuses(const json::value &res)
    {
        signature_status_list statuses {};
        for (const auto &st_v: res.at("value").as_array()) {
            if (st_v.is_null()) {
                statuses.emplace_back();
                continue;
            }
            const auto &st = st_v.as_object();
            signature_status status { json::value_to<uint64_t>(st.at("slot")) };
            if (const auto conf = json::optional_string_at(st, "confirmationStatus"); conf)
                status.confirmation_status = commitment_from_name(*conf);
            if (const auto *err = st.if_contains("err"); err && !err->is_null())
                status.err = json::serialize(*err);
            statuses.emplace_back(std::move(status));
        }
        return statuses;
    }

    std::optional<slot_update> parse_slot_notification(const json::value &msg)
    {
        const auto &obj = msg.as_object();
        const auto *method = obj.if_contains("method");
        if (!method || !method->is_string() || method->as_string() != "slotsUpdatesNotification")
            return {};
        const auto &upd = obj.at("params").at("result").as_object();
        return slot_update {
            json::value_to<uint64_t>(upd.at("slot")),
            slot_update_type_from_name(json::string_at(upd, "type"))
        };
    }
}

namespace tpu_turbo::solana {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    static json::array commitment_params(const commitment c)
    {
        json::array params {};
        params.emplace_back(json::object { { "commitment", commitment_name(c) } });
        return params;
    }

    struct cluster_rpc::impl {
        impl(const std::string &rpc_url, const std::optional<std::string> &ws_url, const std::chrono::seconds timeout, asio::worker &asio_worker)
            : _url { rpc_url }, _ws_url { ws_url }, _timeout { timeout }, _asio_worker { asio_worker }
        {
            const auto parsed = boost::urls::parse_uri(_url);
            if (!parsed)
                throw error("invalid RPC url {}: {}", _url, parsed.error().message());
            const boost::url_view uri = *parsed;
            if (uri.scheme() != "http")
                throw error("only http RPC urls are supported but got {}", _url);
            _host = uri.host();
            _port = uri.port().empty() ? std::string { "80" } : std::string { uri.port() };
            _target = uri.encoded_path().empty() ? std::string { "/" } : std::string { uri.encoded_path() };
            if (uri.has_query())
                _target += fmt::format("?{}", std::string_view { uri.encoded_query() });
        }

        json::value call(const std::string_view method, const json::array &params)
        {
            const auto id = ++_next_id;
            const auto body = rpc::request_body(id, method, params);
            logger::trace("RPC request to {}: {}", _url, body);
            std::string resp_body {};
            try {
                auto resp_f = net::co_spawn(_asio_worker.io_context(), _post(body), net::use_future);
                resp_body = resp_f.get();
            } catch (const std::exception &ex) {
                throw error("RPC {} to {} failed: {}", method, _url, ex.what());
            }
            logger::trace("RPC response from {}: {}", _url, resp_body);
            auto resp = json::parse(buffer { resp_body });
            return rpc::result_of(resp, method);
        }

        std::unique_ptr<subscription> subscribe(const slot_update_handler &handler)
        {
            if (!_ws_url)
                return {};
            return std::make_unique<slot_subscription>(*_ws_url, handler, _asio_worker);
        }
    private:
        const std::string _url;
        const std::optional<std::string> _ws_url;
        const std::chrono::seconds _timeout;
        asio::worker &_asio_worker;
        std::string _host {};
        std::string _port {};
        std::string _target {};
        std::atomic_uint64_t _next_id { 0 };

        net::awaitable<std::string> _post(const std::string body)
        {
            auto executor = co_await net::this_coro::executor;
            tcp::resolver resolver { executor };
            const auto results = co_await resolver.async_resolve(_host, _port, net::use_awaitable);
            beast::tcp_stream stream { executor };
            stream.expires_after(_timeout);
            co_await stream.async_connect(results, net::use_awaitable);

            http::request<http::string_body> req { http::verb::post, _target, 11 };
            req.set(http::field::host, _host);
            req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
            req.set(http::field::content_type, "application/json");
            req.body() = body;
            req.prepare_payload();
            stream.expires_after(_timeout);
            co_await http::async_write(stream, req, net::use_awaitable);

            beast::flat_buffer buf {};
            http::response_parser<http::string_body> parser {};
            parser.body_limit(1 << 26);
            stream.expires_after(_timeout);
            co_await http::async_read(stream, buf, parser, net::use_awaitable);
            auto &resp = parser.get();
            beast::error_code ec {};
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (resp.result_int() != 200)
                throw error("bad http status: {}: {}", resp.result_int(), resp.body());
            co_return std::move(resp.body());
        }
    };

    cluster_rpc::cluster_rpc(const std::string &rpc_url, const std::optional<std::string> &ws_url, const std::chrono::seconds timeout, asio::worker &asio_worker)
        : _impl { std::make_unique<impl>(rpc_url, ws_url, timeout, asio_worker) }
    {
    }

    cluster_rpc::~cluster_rpc() =default;

    json::value cluster_rpc::call(const std::string_view method, const json::array &params)
    {
        return _impl->call(method, params);
    }

    epoch_info cluster_rpc::_epoch_info_impl(const commitment c)
    {
        return rpc::parse_epoch_info(call("getEpochInfo", commitment_params(c)));
    }

    contact_info_list cluster_rpc::_cluster_nodes_impl()
    {
        return rpc::parse_cluster_nodes(call("getClusterNodes"));
    }

    std::vector<pubkey> cluster_rpc::_slot_leaders_impl(const slot_t start_slot, const uint64_t limit)
    {
        return rpc::parse_slot_leaders(call("getSlotLeaders", { start_slot, limit }));
    }

    slot_t cluster_rpc::_slot_impl(const commitment c)
    {
        return json::value_to<uint64_t>(call("getSlot", commitment_params(c)));
    }

    blockhash_info cluster_rpc::_latest_blockhash_impl(const commitment c)
    {
        return rpc::parse_latest_blockhash(call("getLatestBlockhash", commitment_params(c)));
    }

    signature_status_list cluster_rpc::_signature_statuses_impl(const std::vector<signature> &sigs)
    {
        json::array sig_list {};
        for (const auto &sig: sigs)
            sig_list.emplace_back(base58::encode(sig));
        json::array params {};
        params.emplace_back(std::move(sig_list));
        return rpc::parse_signature_statuses(call("getSignatureStatuses", params));
    }

    uint64_t cluster_rpc::_block_height_impl(const commitment c)
    {
        return json::value_to<uint64_t>(call("getBlockHeight", commitment_params(c)));
    }

    std::unique_ptr<subscription> cluster_rpc::_subscribe_slot_updates_impl(const slot_update_handler &handler)
    {
        return _impl->subscribe(handler);
    }
}
