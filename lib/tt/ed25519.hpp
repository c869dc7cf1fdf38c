/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_ED25519_HPP
#define TPU_TURBO_ED25519_HPP

#include <utility>
#include <tt/array.hpp>

namespace tpu_turbo::ed25519 {
    using vkey = byte_array<32>;
    using skey = secure_byte_array<64>;
    using signature = byte_array<64>;
    using seed = secure_byte_array<32>;

    extern void ensure_initialized();
    extern std::pair<skey, vkey> create_from_seed(const buffer &sd);
    extern vkey extract_vk(const buffer &sk);
    extern signature sign(const buffer &msg, const buffer &sk);
    extern bool verify(const buffer &sig, const buffer &vk, const buffer &msg);
}

#endif // !TPU_TURBO_ED25519_HPP
