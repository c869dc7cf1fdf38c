/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_CLI_COMMON_HPP
#define TPU_TURBO_CLI_COMMON_HPP

#include <tt/cli.hpp>
#include <tt/solana/cluster-rpc.hpp>

namespace tpu_turbo::cli::common {
    extern void add_opts(config &cmd);
    // The configuration file, when present, with the --rpc and --ws overrides applied.
    extern std::unique_ptr<tpu_turbo::config> load_config(const options &opts);
    extern std::unique_ptr<solana::cluster_rpc> make_cluster(const tpu_turbo::config &cfg);
}

#endif // !TPU_TURBO_CLI_COMMON_HPP
