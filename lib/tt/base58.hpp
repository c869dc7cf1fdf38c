/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_BASE58_HPP
#define TPU_TURBO_BASE58_HPP

#include <string>
#include <tt/array.hpp>

namespace tpu_turbo::base58 {
    extern std::string encode(const buffer &data);
    extern uint8_vector decode(std::string_view text);

    template<size_t SZ>
    byte_array<SZ> decode_fixed(const std::string_view text)
    {
        const auto bytes = decode(text);
        if (bytes.size() != SZ)
            throw error("base58 value '{}' must decode into {} bytes but got {}", text, SZ, bytes.size());
        return byte_array<SZ> { static_cast<buffer>(bytes) };
    }
}

#endif // !TPU_TURBO_BASE58_HPP
