/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <tt/cli/common.hpp>
#include <tt/tpu/client.hpp>

namespace tpu_turbo::cli::leader_sockets {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "leader-sockets";
            cmd.desc = "print the TPU addresses of the leaders of the upcoming slots";
            common::add_opts(cmd);
            cmd.opts.try_emplace("fanout", option_config { "the number of upcoming slots, fanoutSlots from the configuration by default" });
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto cfg = common::load_config(opts);
            auto cluster = common::make_cluster(*cfg);
            auto client_cfg = tpu::client_config::from(*cfg);
            if (const auto it = opts.find("fanout"); it != opts.end() && it->second)
                client_cfg.fanout_slots = std::stoull(*it->second);
            const auto svc = tpu::leader_service::load(*cluster, false, false);
            const tpu::client c { *svc, client_cfg };
            const auto sched = svc->cache().schedule();
            logger::info("the leader schedule covers slots {}-{}", sched->first_slot, sched->last_slot());
            const auto sockets = svc->leader_sockets(c.fanout_slots());
            logger::info("{} distinct leader addresses for the next {} slots", sockets.size(), c.fanout_slots());
            for (const auto &addr: sockets)
                std::cout << addr.to_string() << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
