/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_ARRAY_HPP
#define TPU_TURBO_ARRAY_HPP

#include <array>
#include <cstring>
#include <span>
#include <tt/bytes.hpp>

namespace tpu_turbo {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const std::initializer_list<uint8_t> s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error("span must be of size {} but got {}", SZ, s.size());
            std::copy(s.begin(), s.end(), base_type::begin());
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error("buffer must be of size {} but got {}", SZ, s.size());
            memcpy(base_type::data(), s.data(), SZ);
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error("buffer must be of size {} but got {}", SZ, s.size());
            memcpy(base_type::data(), s.data(), SZ);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        std::span<const uint8_t> span() const noexcept
        {
            return { base_type::data(), SZ };
        }
    };

    extern void secure_clear(std::span<uint8_t> store);

    template<size_t SZ>
    struct secure_byte_array: byte_array<SZ>
    {
        using byte_array<SZ>::byte_array;

        secure_byte_array(const secure_byte_array<SZ> &) =default;
        secure_byte_array<SZ> &operator=(const secure_byte_array<SZ> &) =default;

        ~secure_byte_array()
        {
            secure_clear(*this);
        }
    };
}

namespace std {
    template<size_t SZ>
    struct hash<tpu_turbo::byte_array<SZ>> {
        size_t operator()(const tpu_turbo::byte_array<SZ> &a) const noexcept
        {
            static_assert(SZ >= sizeof(size_t));
            size_t h;
            memcpy(&h, a.data(), sizeof(h));
            return h;
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<tpu_turbo::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.span());
        }
    };

    template<size_t SZ>
    struct formatter<tpu_turbo::secure_byte_array<SZ>>: formatter<tpu_turbo::byte_array<SZ>> {
    };
}

#endif // !TPU_TURBO_ARRAY_HPP
