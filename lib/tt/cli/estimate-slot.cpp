/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <thread>
#include <tt/cli/common.hpp>
#include <tt/tpu/leader-service.hpp>

namespace tpu_turbo::cli::estimate_slot {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "estimate-slot";
            cmd.desc = "follow the slot updates and print the estimated current slot every second";
            common::add_opts(cmd);
            cmd.opts.try_emplace("duration", option_config { "the number of seconds to follow the cluster", "10" });
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto cfg = common::load_config(opts);
            auto cluster = common::make_cluster(*cfg);
            const auto duration = std::stoull(opts.at("duration").value());
            const auto svc = tpu::leader_service::load(*cluster);
            for (uint64_t i = 0; i < duration; ++i) {
                std::this_thread::sleep_for(std::chrono::seconds { 1 });
                const auto sched = svc->cache().schedule();
                const auto est = svc->estimate_slot();
                const auto leader = svc->cache().leader_for_slot(est);
                std::cout << fmt::format("slot: {} leader: {} schedule: {}-{}\n", est,
                    leader ? base58::encode(*leader) : std::string { "unknown" }, sched->first_slot, sched->last_slot());
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
