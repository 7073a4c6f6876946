#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

#include "core/records/connection_params.hpp"
#include "core/records/transfer_record.hpp"
#include "infra/error_handler/error.hpp"

namespace YAML {

template<>
struct convert<reflux::core::TransferRecord> {
    static Node encode(const reflux::core::TransferRecord& rhs);
    static bool decode(const Node& node, reflux::core::TransferRecord& rhs);
};

template<>
struct convert<reflux::core::ConnectionParams> {
    static Node encode(const reflux::core::ConnectionParams& rhs);
    static bool decode(const Node& node, reflux::core::ConnectionParams& rhs);
};

} // namespace YAML

namespace reflux::core::codec {

// Кодек значения хранилища: YAML-документ через YAML::convert<T>.
// Для YAML::Node (атрибуты) copy() делает глубокую копию, иначе узлы делили бы память.
template<typename T>
struct YamlCodec {
    [[nodiscard]] static auto encode(const T& value) -> infra::Result<std::string> {
        try {
            YAML::Emitter out;
            out << YAML::Node(value);
            if (!out.good()) {
                return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                                       fmt::format("encode failed: {}", out.GetLastError())));
            }
            return std::string(out.c_str(), out.size());
        } catch (const YAML::Exception& e) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                                   fmt::format("encode failed: {}", e.what())));
        }
    }

    [[nodiscard]] static auto decode(std::string_view bytes) -> infra::Result<T> {
        try {
            return YAML::Load(std::string(bytes)).as<T>();
        } catch (const YAML::Exception& e) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                                   fmt::format("decode failed: {}", e.what())));
        }
    }

    [[nodiscard]] static auto copy(const T& value) -> T {
        if constexpr (std::is_same_v<T, YAML::Node>) {
            return YAML::Clone(value);
        } else {
            return value;
        }
    }
};

} // namespace reflux::core::codec
