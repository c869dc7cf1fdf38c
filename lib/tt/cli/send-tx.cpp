/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <tt/base64.hpp>
#include <tt/cli/common.hpp>
#include <tt/file.hpp>
#include <tt/tpu/connection.hpp>

namespace tpu_turbo::cli::send_tx {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "send-tx";
            cmd.desc = "send a signed transaction to the upcoming leaders and print its signature";
            cmd.args.expect({ "<tx-file>" });
            common::add_opts(cmd);
            cmd.opts.try_emplace("base64", option_config { "the transaction file contains base64 text instead of raw bytes" });
            cmd.opts.try_emplace("confirm", option_config { "wait until the transaction reaches the configured commitment level" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto cfg = common::load_config(opts);
            auto raw_tx = file::read(args.at(0));
            if (opts.contains("base64"))
                raw_tx = base64::decode(raw_tx.str());
            const auto tx = solana::parse_transaction(raw_tx);
            logger::info("sending a {} transaction of {} bytes", std::holds_alternative<solana::legacy_transaction>(tx) ? "legacy" : "versioned", raw_tx.size());
            auto cluster = common::make_cluster(*cfg);
            const auto svc = tpu::leader_service::load(*cluster);
            tpu::client c { *svc, tpu::client_config::from(*cfg) };
            solana::signature sig {};
            if (opts.contains("confirm")) {
                const auto commitment = solana::commitment_from_name(cfg->get<std::string>("commitment", "confirmed"));
                const std::chrono::seconds timeout { cfg->get<int64_t>("confirmTimeoutSec", 60) };
                tpu::connection conn { c, timeout };
                sig = conn.send_and_confirm_raw(raw_tx, commitment);
            } else {
                sig = c.send_raw(raw_tx);
            }
            std::cout << base58::encode(sig) << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
