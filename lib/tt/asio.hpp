/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_ASIO_HPP
#define TPU_TURBO_ASIO_HPP

#include <functional>
#include <memory>
#include <string>

namespace boost::asio {
    class io_context;
}

namespace tpu_turbo::asio {
    // Owns an io_context and a thread running it until the worker is destroyed.
    struct worker {
        static worker &get();
        explicit worker();
        ~worker();
        boost::asio::io_context &io_context();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !TPU_TURBO_ASIO_HPP
