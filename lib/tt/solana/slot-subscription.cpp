/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifdef _MSC_VER
#   include <SDKDDKVer.h>
#endif
#include <atomic>
#include <condition_variable>
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/url.hpp>
#include <tt/json.hpp>
#include <tt/logger.hpp>
#include <tt/mutex.hpp>
#include <tt/solana/cluster-rpc.hpp>
#include <tt/solana/slot-subscription.hpp>

namespace tpu_turbo::solana {
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    struct slot_subscription::impl {
        impl(const std::string &ws_url, const slot_update_handler &handler, asio::worker &asio_worker)
            : _url { ws_url }, _asio_worker { asio_worker }, _state { std::make_shared<state>(handler) }
        {
            const auto parsed = boost::urls::parse_uri(_url);
            if (!parsed)
                throw error("invalid WebSocket url {}: {}", _url, parsed.error().message());
            const boost::url_view uri = *parsed;
            if (uri.scheme() != "ws")
                throw error("only ws urls are supported but got {}", _url);
            _host = uri.host();
            _port = uri.port().empty() ? std::string { "80" } : std::string { uri.port() };
            _target = uri.encoded_path().empty() ? std::string { "/" } : std::string { uri.encoded_path() };
            net::co_spawn(_asio_worker.io_context(), _run(_state), net::detached);
        }

        ~impl()
        {
            _state->stopped = true;
            net::post(_asio_worker.io_context(), [st=_state] {
                if (st->timer)
                    st->timer->cancel();
                if (st->ws)
                    beast::get_lowest_layer(*st->ws).cancel();
            });
            mutex::unique_lock lk { _state->done_mutex };
            _state->done_cv.wait(lk, [&] { return _state->done; });
            logger::debug("slot subscription to {} stopped", _url);
        }
    private:
        // Shared with the coroutine; the members besides the flags are touched only from the asio thread.
        struct state {
            explicit state(const slot_update_handler &h): handler { h }
            {
            }

            slot_update_handler handler;
            std::atomic_bool stopped { false };
            std::optional<websocket::stream<beast::tcp_stream>> ws {};
            std::optional<net::steady_timer> timer {};
            alignas(mutex::padding) mutex::unique_lock::mutex_type done_mutex {};
            std::condition_variable_any done_cv {};
            bool done = false;
        };

        const std::string _url;
        asio::worker &_asio_worker;
        std::shared_ptr<state> _state;
        std::string _host {};
        std::string _port {};
        std::string _target {};

        net::awaitable<void> _run(const std::shared_ptr<state> st)
        {
            while (!st->stopped) {
                try {
                    co_await _session(st);
                } catch (const std::exception &ex) {
                    if (!st->stopped)
                        logger::warn("slot subscription to {} failed: {}; reconnecting", _url, ex.what());
                }
                st->ws.reset();
                if (st->stopped)
                    break;
                st->timer.emplace(co_await net::this_coro::executor, reconnect_delay);
                beast::error_code ec {};
                co_await st->timer->async_wait(net::redirect_error(net::use_awaitable, ec));
                st->timer.reset();
            }
            {
                mutex::scoped_lock lk { st->done_mutex };
                st->done = true;
            }
            st->done_cv.notify_all();
        }

        net::awaitable<void> _session(const std::shared_ptr<state> st)
        {
            auto executor = co_await net::this_coro::executor;
            tcp::resolver resolver { executor };
            const auto results = co_await resolver.async_resolve(_host, _port, net::use_awaitable);
            if (st->stopped)
                co_return;
            auto &ws = st->ws.emplace(executor);
            beast::get_lowest_layer(ws).expires_after(connect_timeout);
            co_await beast::get_lowest_layer(ws).async_connect(results, net::use_awaitable);
            beast::get_lowest_layer(ws).expires_never();
            ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            co_await ws.async_handshake(_host, _target, net::use_awaitable);
            const auto sub_req = rpc::request_body(1, "slotsUpdatesSubscribe", {});
            co_await ws.async_write(net::buffer(sub_req), net::use_awaitable);
            logger::info("subscribed to slot updates at {}", _url);
            beast::flat_buffer buf {};
            while (!st->stopped) {
                buf.clear();
                co_await ws.async_read(buf, net::use_awaitable);
                const auto msg = beast::buffers_to_string(buf.data());
                std::optional<slot_update> upd {};
                try {
                    upd = rpc::parse_slot_notification(json::parse(buffer { msg }));
                } catch (const std::exception &ex) {
                    logger::warn("ignoring an unparsable slot update message: {}: {}", msg, ex.what());
                }
                if (upd)
                    st->handler(*upd);
            }
        }
    };

    slot_subscription::slot_subscription(const std::string &ws_url, const slot_update_handler &handler, asio::worker &asio_worker)
        : _impl { std::make_unique<impl>(ws_url, handler, asio_worker) }
    {
    }

    slot_subscription::~slot_subscription() =default;
}
