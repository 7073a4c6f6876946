#include "codec.hpp"

#include <chrono>
#include <cstdint>

namespace {

using reflux::core::Timestamp;

// Наносекунды от эпохи: без потерь для system_clock
std::int64_t to_nanos(const Timestamp& tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

Timestamp from_nanos(std::int64_t nanos) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(nanos)));
}

} // namespace

namespace YAML {

Node convert<reflux::core::TransferRecord>::encode(const reflux::core::TransferRecord& rhs) {
    Node node;
    node["source"] = rhs.source_path;
    node["target"] = rhs.target_path;
    node["status"] = std::string(reflux::core::to_string(rhs.status));
    node["bytes_transferred"] = rhs.bytes_transferred;
    if (rhs.time_start) node["time_start"] = to_nanos(*rhs.time_start);
    if (rhs.time_end) node["time_end"] = to_nanos(*rhs.time_end);
    if (rhs.error_msg) node["error"] = *rhs.error_msg;
    return node;
}

bool convert<reflux::core::TransferRecord>::decode(const Node& node, reflux::core::TransferRecord& rhs) {
    if (!node.IsMap() || !node["source"] || !node["status"]) {
        return false;
    }

    auto status = reflux::core::status_from_string(node["status"].as<std::string>());
    if (!status) {
        return false;
    }

    rhs = reflux::core::TransferRecord{};
    rhs.source_path = node["source"].as<std::string>();
    if (node["target"]) rhs.target_path = node["target"].as<std::string>();
    rhs.status = *status;
    if (node["bytes_transferred"]) rhs.bytes_transferred = node["bytes_transferred"].as<std::uint64_t>();
    if (node["time_start"]) rhs.time_start = from_nanos(node["time_start"].as<std::int64_t>());
    if (node["time_end"]) rhs.time_end = from_nanos(node["time_end"].as<std::int64_t>());
    if (node["error"]) rhs.error_msg = node["error"].as<std::string>();
    return true;
}

Node convert<reflux::core::ConnectionParams>::encode(const reflux::core::ConnectionParams& rhs) {
    Node node;
    node["address"] = rhs.address;
    node["port"] = rhs.port;
    node["user"] = rhs.user;
    return node;
}

bool convert<reflux::core::ConnectionParams>::decode(const Node& node, reflux::core::ConnectionParams& rhs) {
    if (!node.IsMap() || !node["address"] || !node["port"] || !node["user"]) {
        return false;
    }
    rhs.address = node["address"].as<std::string>();
    rhs.port = node["port"].as<int>();
    rhs.user = node["user"].as<std::string>();
    return true;
}

} // namespace YAML
