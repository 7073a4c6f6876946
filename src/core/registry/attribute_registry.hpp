#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

#include "core/registry/registry.hpp"

namespace reflux::core {

// Произвольные данные вызывающего кода (например, флаги запуска).
// Схемы нет: значение это любой YAML-узел.
class AttributeRegistry final : public Registry<YAML::Node> {
public:
    explicit AttributeRegistry(storage::DurableStore& store)
        : Registry(store, storage::ns::additional_data) {}

    // Типизированные обёртки поверх YAML::convert<T>
    template<typename T>
    [[nodiscard]] auto store_as(const std::string& key, const T& value) -> infra::VoidResult {
        return store_or_update(key, YAML::Node(value));
    }

    // NotFound, если ключа нет; Validation, если значение не приводится к T
    template<typename T>
    [[nodiscard]] auto load_as(const std::string& key) const -> infra::Result<T> {
        auto node = load(key);
        if (!node) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
                                   fmt::format("'{}' key not found in '{}'", key, name())));
        }
        try {
            return node->as<T>();
        } catch (const YAML::Exception& e) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Validation,
                                   fmt::format("'{}': {}", key, e.what())));
        }
    }
};

} // namespace reflux::core
