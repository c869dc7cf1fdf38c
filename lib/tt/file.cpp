/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <fstream>
#include <tt/file.hpp>

namespace tpu_turbo::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::ifstream is { path, std::ios::binary | std::ios::ate };
        if (!is)
            throw error_sys("failed to open file {} for reading", path);
        const auto sz = is.tellg();
        if (sz < 0)
            throw error_sys("failed to determine the size of {}", path);
        buf.resize(static_cast<size_t>(sz));
        is.seekg(0);
        if (!is.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size())))
            throw error_sys("failed to read {} bytes from {}", buf.size(), path);
    }

    void write(const std::string &path, const buffer &data)
    {
        if (const auto dir = std::filesystem::path { path }.parent_path(); !dir.empty())
            std::filesystem::create_directories(dir);
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys("failed to open file {} for writing", path);
        if (!os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size())))
            throw error_sys("failed to write {} bytes to {}", data.size(), path);
    }
}
