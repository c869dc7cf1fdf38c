/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <atomic>
#include <chrono>
#include <thread>
#ifdef __clang__
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#ifdef __clang__
#   pragma GCC diagnostic pop
#endif
#include <tt/asio.hpp>
#include <tt/logger.hpp>

namespace tpu_turbo::asio {
    namespace net = boost::asio;

    struct worker::impl {
        explicit impl() =default;

        ~impl()
        {
            _shutdown = true;
            _work_guard.reset();
            _ioc.stop();
            _worker.join();
        }

        net::io_context &io_context()
        {
            return _ioc;
        }
    private:
        static void _run_isolated(const std::string_view &name, const std::function<void()> &act)
        {
            try {
                act();
            } catch (const std::exception &ex) {
                logger::error("asio {} failed: {}", name, ex.what());
            } catch (...) {
                logger::error("asio {} failed: unknown exception", name);
            }
        }

        void _io_thread()
        {
            for (;;) {
                static std::string_view loop_name { "asio loop" };
                _run_isolated(loop_name, [&] {
                    _ioc.run_for(std::chrono::milliseconds { 100 });
                });
                if (_shutdown)
                    break;
                if (_ioc.stopped())
                    _ioc.restart();
            }
        }

        std::atomic_bool _shutdown { false };
        net::io_context _ioc {};
        net::executor_work_guard<net::io_context::executor_type> _work_guard = net::make_work_guard(_ioc);
        std::thread _worker { [&] { _io_thread(); } };
    };

    worker &worker::get()
    {
        static worker w {};
        return w;
    }

    worker::worker(): _impl { std::make_unique<impl>() }
    {
    }

    worker::~worker() =default;

    net::io_context &worker::io_context()
    {
        return _impl->io_context();
    }
}
