/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <tt/config.hpp>
#include <tt/logger.hpp>

namespace tpu_turbo {
    static std::optional<std::string> &_config_default_path()
    {
        static std::optional<std::string> p {};
        return p;
    }

    void config_file::set_default_path(const std::optional<std::string> &p)
    {
        _config_default_path() = p;
    }

    std::string config_file::default_path()
    {
        std::optional<std::string> path = _config_default_path();
        if (const char *env_path = std::getenv("TT_CONFIG"); !path && env_path)
            path.emplace(env_path);
        if (!path)
            path.emplace("./etc/tt.json");
        logger::debug("configuration file: {}", *path);
        return *path;
    }

    config_file::config_file(const std::string &path)
        : _path { path }, _parsed { json::load(path).as_object() }
    {
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error("configuration file {} does not have the element {}!", _path, name);
        return it->value();
    }
}
