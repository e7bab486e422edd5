#include "EngineConfig.hpp"
#include <fstream>
#include <iterator>
#include <iostream>
#include <stdexcept>

namespace pcmflow {

ErrorCode EngineConfig::validate() const {
    if (sample_rate == 0 || channels == 0 || block_size == 0) {
        return ErrorCode::InvalidParameter;
    }
    if (max_slots == 0 || command_capacity == 0 || max_block_frames == 0) {
        return ErrorCode::InvalidParameter;
    }
    if (sink_queue_capacity == 0 || prefetch_capacity_frames == 0) {
        return ErrorCode::InvalidParameter;
    }
    return ErrorCode::Ok;
}

MixerConfig EngineConfig::mixer_config() const {
    MixerConfig config;
    config.max_slots = max_slots;
    config.command_capacity = command_capacity;
    config.drain_ticks = drain_ticks;
    config.keep_alive_if_empty = keep_alive_if_empty;
    config.max_block_frames = max_block_frames;
    return config;
}

StreamFormat EngineConfig::device_stream_format() const {
    return StreamFormat{channels, sample_rate, device_format};
}

void to_json(json& j, const EngineConfig& config) {
    j = json{
        {"version", config.version},
        {"device", config.device},
        {"sample_rate", config.sample_rate},
        {"channels", config.channels},
        {"block_size", config.block_size},
        {"device_format", to_string(config.device_format)},
        {"max_slots", config.max_slots},
        {"command_capacity", config.command_capacity},
        {"drain_ticks", config.drain_ticks},
        {"keep_alive_if_empty", config.keep_alive_if_empty},
        {"max_block_frames", config.max_block_frames},
        {"sink_queue_capacity", config.sink_queue_capacity},
        {"prefetch_capacity_frames", config.prefetch_capacity_frames}
    };
}

void from_json(const json& j, EngineConfig& config) {
    const EngineConfig defaults;

    config.version = j.value("version", defaults.version);
    config.device = j.value("device", defaults.device);
    config.sample_rate = j.value("sample_rate", defaults.sample_rate);
    config.channels = j.value("channels", defaults.channels);
    config.block_size = j.value("block_size", defaults.block_size);

    const std::string format_name = j.value("device_format", std::string(to_string(defaults.device_format)));
    const auto format = sample_format_from_string(format_name);
    if (!format) {
        throw std::invalid_argument("Unknown sample format: " + format_name);
    }
    config.device_format = *format;

    config.max_slots = j.value("max_slots", defaults.max_slots);
    config.command_capacity = j.value("command_capacity", defaults.command_capacity);
    config.drain_ticks = j.value("drain_ticks", defaults.drain_ticks);
    config.keep_alive_if_empty = j.value("keep_alive_if_empty", defaults.keep_alive_if_empty);
    config.max_block_frames = j.value("max_block_frames", defaults.max_block_frames);
    config.sink_queue_capacity = j.value("sink_queue_capacity", defaults.sink_queue_capacity);
    config.prefetch_capacity_frames = j.value("prefetch_capacity_frames", defaults.prefetch_capacity_frames);
}

bool ConfigStore::deserialize(EngineConfig& config, const std::string& data) {
    try {
        EngineConfig parsed = json::parse(data).get<EngineConfig>();
        const ErrorCode result = parsed.validate();
        if (result != ErrorCode::Ok) {
            std::cerr << "[ConfigStore] Rejected configuration: " << to_string(result) << std::endl;
            return false;
        }
        config = parsed;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] Malformed JSON: " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ConfigStore] " << e.what() << std::endl;
        return false;
    }
}

bool ConfigStore::save_to_file(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(EngineConfig& config, const std::string& path) {
    std::cout << "[ConfigStore] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    const bool success = deserialize(config, content);
    if (success) {
        std::cout << "[ConfigStore] Loaded configuration for device: " << config.device << std::endl;
    } else {
        std::cerr << "[ConfigStore] Failed to deserialize configuration from: " << path << std::endl;
    }
    return success;
}

} // namespace pcmflow
