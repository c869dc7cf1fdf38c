/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <tt/cli/common.hpp>

namespace tpu_turbo::cli::common {
    void add_opts(config &cmd)
    {
        cmd.opts.try_emplace("config", option_config { "a JSON configuration file, ./etc/tt.json or TT_CONFIG by default" });
        cmd.opts.try_emplace("rpc", option_config { "the HTTP JSON-RPC endpoint of the cluster, overrides the configured rpc" });
        cmd.opts.try_emplace("ws", option_config { "the WebSocket endpoint for slot updates, overrides the configured websocket" });
    }

    std::unique_ptr<tpu_turbo::config> load_config(const options &opts)
    {
        if (const auto it = opts.find("config"); it != opts.end() && it->second)
            config_file::set_default_path(*it->second);
        const auto path = config_file::default_path();
        json::object cfg {};
        if (std::filesystem::exists(path)) {
            cfg = config_file { path }.json();
        } else {
            logger::debug("the configuration file {} does not exist; relying on command-line options", path);
        }
        if (const auto it = opts.find("rpc"); it != opts.end() && it->second)
            cfg.insert_or_assign("rpc", *it->second);
        if (const auto it = opts.find("ws"); it != opts.end() && it->second)
            cfg.insert_or_assign("websocket", *it->second);
        if (!cfg.contains("rpc"))
            throw error("the RPC endpoint must be configured either in {} or with --rpc", path);
        return std::make_unique<config_json>(std::move(cfg));
    }

    std::unique_ptr<solana::cluster_rpc> make_cluster(const tpu_turbo::config &cfg)
    {
        const auto rpc_url = cfg.get<std::string>("rpc", "");
        std::optional<std::string> ws_url {};
        if (const auto ws = cfg.get<std::string>("websocket", ""); !ws.empty())
            ws_url = ws;
        logger::info("cluster RPC: {} slot updates: {}", rpc_url, ws_url.value_or("disabled"));
        return std::make_unique<solana::cluster_rpc>(rpc_url, ws_url);
    }
}
