/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_FILE_HPP
#define TPU_TURBO_FILE_HPP

#include <string>
#include <tt/bytes.hpp>

namespace tpu_turbo::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, const buffer &data);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }
}

#endif // !TPU_TURBO_FILE_HPP
