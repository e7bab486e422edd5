/**
 * @file EngineConfig.hpp
 * @brief Engine settings and their JSON persistence.
 */

#ifndef PCMFLOW_ENGINE_CONFIG_HPP
#define PCMFLOW_ENGINE_CONFIG_HPP

#include "StreamFormat.hpp"
#include "ErrorCode.hpp"
#include "Mixer.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace pcmflow {

using json = nlohmann::json;

/**
 * @brief Everything needed to open an output stream and size its queues.
 */
struct EngineConfig {
    int version = 1;

    // Device
    std::string device = "default";
    SampleRate sample_rate = 44100;
    ChannelCount channels = 2;
    size_t block_size = 512;
    SampleFormat device_format = SampleFormat::I32;

    // Mixer
    size_t max_slots = 64;
    size_t command_capacity = 256;
    uint32_t drain_ticks = 0;
    bool keep_alive_if_empty = true;
    size_t max_block_frames = 1024;

    // Sinks and sources
    size_t sink_queue_capacity = 64;
    size_t prefetch_capacity_frames = 8192;

    /**
     * @brief Rejects zero rates, channels and capacities.
     */
    ErrorCode validate() const;

    MixerConfig mixer_config() const;

    /**
     * @brief Format requested from the device.
     */
    StreamFormat device_stream_format() const;
};

void to_json(json& j, const EngineConfig& config);

/**
 * @brief Missing keys keep their defaults.
 *
 * @throws std::invalid_argument on an unknown sample format name.
 */
void from_json(const json& j, EngineConfig& config);

/**
 * @brief Saves and loads EngineConfig as human-readable JSON.
 */
class ConfigStore {
public:
    static bool save_to_file(const EngineConfig& config, const std::string& path);
    static bool load_from_file(EngineConfig& config, const std::string& path);

    static std::string serialize(const EngineConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Parse and validate. @p config is left untouched on failure.
     */
    static bool deserialize(EngineConfig& config, const std::string& data);
};

} // namespace pcmflow

#endif // PCMFLOW_ENGINE_CONFIG_HPP
