/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_CONFIG_HPP
#define TPU_TURBO_CONFIG_HPP

#include <optional>
#include <tt/json.hpp>

namespace tpu_turbo {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] bool contains(const std::string_view &name) const
        {
            return json().contains(name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        template<typename T>
        [[nodiscard]] T get(const std::string_view &name, const T &default_value) const
        {
            const auto it = json().find(name);
            if (it == json().end() || it->value().is_null())
                return default_value;
            return json::value_to<T>(it->value());
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error("Config does not have the requested {} element!", name);
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        static void set_default_path(const std::optional<std::string> &);
        static std::string default_path();

        explicit config_file(const std::string &path);
    private:
        std::string _path;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };
}

#endif // !TPU_TURBO_CONFIG_HPP
