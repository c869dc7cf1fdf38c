/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <thread>
#include <tt/tpu/recent-slots.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;
using namespace tpu_turbo::tpu;

suite tpu_recent_slots_suite = [] {
    "tpu::recent_slots"_test = [] {
        "initial slot"_test = [] {
            const recent_slots rs { 1000 };
            test_same(1, rs.size());
            test_same(1000, rs.estimate());
        };
        "median of unordered observations"_test = [] {
            recent_slots rs { 100 };
            for (const slot_t s: { 102, 98, 101, 99 })
                rs.record(s);
            test_same(102, rs.estimate());
        };
        "lag compensation"_test = [] {
            recent_slots rs { 10 };
            rs.record(11);
            rs.record(12);
            // sorted: 10 11 12; median index 1; expected 11 + 1
            test_same(12, rs.estimate());
        };
        "outliers above the skip distance are ignored"_test = [] {
            recent_slots rs { 100 };
            rs.record(101);
            rs.record(102);
            rs.record(100 + 1 + 48 + 1000);
            // sorted: 100 101 102 1149; median index 1; expected 101 + 2 = 103; bound 151
            test_same(102, rs.estimate());
            rs.record(150);
            test_same(150, rs.estimate());
        };
        "bounded window"_test = [] {
            recent_slots rs { 1 };
            for (slot_t s = 1000; s < 1020; ++s)
                rs.record(s);
            test_same(recent_slots::max_recent_slots, rs.size());
            // the initial outlier has been evicted
            test_same(1019, rs.estimate());
        };
        "the estimate is always a recorded slot"_test = [] {
            recent_slots rs { 500 };
            for (const slot_t s: { 510, 505, 2000, 507, 3000, 509 }) {
                rs.record(s);
                const auto est = rs.estimate();
                expect(est == 500 || est == 510 || est == 505 || est == 2000 || est == 507 || est == 3000 || est == 509) << est;
            }
        };
        "concurrent record and estimate"_test = [] {
            recent_slots rs { 0 };
            std::thread writer { [&] {
                for (slot_t s = 1; s <= 10000; ++s)
                    rs.record(s);
            } };
            slot_t last = 0;
            for (size_t i = 0; i < 1000; ++i)
                last = std::max(last, rs.estimate());
            writer.join();
            test_same(10000, rs.estimate());
            expect(last <= 10000);
        };
    };
};
