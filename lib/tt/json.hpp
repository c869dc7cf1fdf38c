/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_JSON_HPP
#define TPU_TURBO_JSON_HPP

#include <boost/json.hpp>
#include <tt/file.hpp>

namespace tpu_turbo::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    inline std::string_view string_at(const json::object &obj, const std::string_view key)
    {
        return static_cast<std::string_view>(obj.at(key).as_string());
    }

    inline std::optional<std::string> optional_string_at(const json::object &obj, const std::string_view key)
    {
        const auto it = obj.find(key);
        if (it == obj.end() || it->value().is_null())
            return {};
        return std::string { static_cast<std::string_view>(it->value().as_string()) };
    }
}

#endif // !TPU_TURBO_JSON_HPP
