/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_ERROR_HPP
#define TPU_TURBO_ERROR_HPP

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tt/format.hpp>

namespace tpu_turbo {
    struct error: std::runtime_error {
        template<typename... Args>
        explicit error(const std::string_view &fmt, Args&&... a)
            : error { formatted {}, fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...) }
        {
        }
    protected:
        struct formatted {};

        explicit error(formatted, const std::string &msg);
    };

    struct error_sys: error {
        template<typename... Args>
        explicit error_sys(const std::string_view &fmt, Args&&... a)
            : error { formatted {}, fmt::format("{}, errno: {}, strerror: {}", fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...), errno, std::strerror(errno)) }
        {
        }
    };

    // the current slot cannot be estimated since no slot has been observed yet
    struct empty_state_error: error {
        using error::error;
    };

    // a transaction was passed with an incompatible set of signers
    struct invalid_arguments_error: error {
        using error::error;
    };

    // the cluster reported a failed execution of a submitted transaction
    struct transaction_failed_error: error {
        using error::error;
    };
}

#endif // !TPU_TURBO_ERROR_HPP
