/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_TIMER_HPP
#define TPU_TURBO_TIMER_HPP

#include <chrono>
#include <exception>
#include <tt/logger.hpp>

namespace tpu_turbo {
    struct timer {
        using clock = std::chrono::steady_clock;

        explicit timer(const std::string_view &title, const logger::level lev=logger::level::trace)
            : _title { title }, _level { lev }, _start_time { clock::now() }
        {
        }

        ~timer()
        {
            if (!_printed) {
                _printed = true;
                if (std::uncaught_exceptions() == 0)
                    logger::log(_level, "{} took {:0.3f} secs", _title, duration());
                else
                    logger::log(_level, "{} failed after {:0.3f} secs", _title, duration());
            }
        }

        double duration() const
        {
            const std::chrono::duration<double> elapsed = clock::now() - _start_time;
            return elapsed.count();
        }

        void cancel_print()
        {
            _printed = true;
        }
    private:
        const std::string _title;
        const logger::level _level;
        const clock::time_point _start_time;
        bool _printed = false;
    };
}

#endif // !TPU_TURBO_TIMER_HPP
