/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <memory>
#include <pthread.h>

namespace pcmflow::hal {

snd_pcm_format_t to_alsa_format(SampleFormat format) {
    switch (format) {
        case SampleFormat::U8:  return SND_PCM_FORMAT_U8;
        case SampleFormat::I8:  return SND_PCM_FORMAT_S8;
        case SampleFormat::U16: return SND_PCM_FORMAT_U16_LE;
        case SampleFormat::I16: return SND_PCM_FORMAT_S16_LE;
        case SampleFormat::I32: return SND_PCM_FORMAT_S32_LE;
        case SampleFormat::U32: return SND_PCM_FORMAT_U32_LE;
        case SampleFormat::F32: return SND_PCM_FORMAT_FLOAT_LE;
        case SampleFormat::F64: return SND_PCM_FORMAT_FLOAT64_LE;
    }
    return SND_PCM_FORMAT_UNKNOWN;
}

AlsaDriver::AlsaDriver(const StreamFormat& requested, size_t block_size, const std::string& device)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , format_(requested)
    , block_size_(block_size)
    , running_(false)
{
    // Buffers are sized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    stop();
}

bool AlsaDriver::open() {
    if (pcm_handle_) return true;
    if (!setup_pcm()) {
        close_pcm();
        return false;
    }
    return true;
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!open()) {
        return false;
    }

    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);
    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::setup_pcm() {
    int err;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        std::cerr << "ALSA: Cannot open audio device " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        pcm_handle_ = nullptr;
        return false;
    }

    snd_pcm_hw_params_t* raw_params = nullptr;
    if ((err = snd_pcm_hw_params_malloc(&raw_params)) < 0) {
        std::cerr << "ALSA: Cannot allocate hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    std::unique_ptr<snd_pcm_hw_params_t, decltype(&snd_pcm_hw_params_free)> hw_params(raw_params,
                                                                                      &snd_pcm_hw_params_free);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params.get())) < 0) {
        std::cerr << "ALSA: Cannot initialize hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params.get(), SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        std::cerr << "ALSA: Cannot set access type (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    // Requested encoding first, then the high resolution and universal fallbacks
    const SampleFormat candidates[] = {format_.encoding, SampleFormat::I32, SampleFormat::I16};
    bool format_set = false;
    for (SampleFormat candidate : candidates) {
        err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), to_alsa_format(candidate));
        if (err >= 0) {
            if (candidate != format_.encoding) {
                std::cerr << "ALSA: Cannot set " << to_string(format_.encoding) << ", falling back to "
                          << to_string(candidate) << std::endl;
            }
            format_.encoding = candidate;
            format_set = true;
            break;
        }
    }
    if (!format_set) {
        std::cerr << "ALSA: Cannot set sample format (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    unsigned int rate = format_.sample_rate;
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params.get(), &rate, 0)) < 0) {
        std::cerr << "ALSA: Cannot set sample rate (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    format_.sample_rate = rate;

    unsigned int channels = format_.channels;
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params.get(), &channels)) < 0) {
        std::cerr << "ALSA: Cannot set channel count (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    format_.channels = static_cast<ChannelCount>(channels);

    snd_pcm_uframes_t frames = block_size_;
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params.get(), &frames, 0)) < 0) {
        std::cerr << "ALSA: Cannot set period size (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    block_size_ = static_cast<size_t>(frames);

    unsigned int periods = 4;
    if ((err = snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params.get(), &periods, 0)) < 0) {
        std::cerr << "ALSA: Cannot set period count, using device default (" << snd_strerror(err) << ")" << std::endl;
    }

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params.get())) < 0) {
        std::cerr << "ALSA: Cannot set parameters (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    interleaved_buffer_.assign(block_size_ * format_.bytes_per_frame(), std::byte{0});

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    std::cout << "ALSA: Opened " << device_name_ << " as " << format_ << ", period " << block_size_
              << " frames" << std::endl;
    return true;
}

void AlsaDriver::thread_loop() {
    // Set Real-Time Priority (SCHED_FIFO, Priority 80)
    struct sched_param param;
    param.sched_priority = 80;
    int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res != 0) {
        if (res == EPERM) {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
        } else {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: Unknown Error");
        }
    } else {
        AudioLogger::instance().log_message("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
    }

    std::span<std::byte> buffer(interleaved_buffer_);
    const size_t sample_bytes = bytes_per_sample(format_.encoding);

    while (running_) {
        if (callback_) {
            callback_(buffer, block_size_);
        } else {
            std::byte* dest = buffer.data();
            for (size_t i = 0; i < block_size_ * format_.channels; ++i) {
                encode_silence(format_.encoding, dest);
                dest += sample_bytes;
            }
        }

        snd_pcm_sframes_t err = snd_pcm_writei(pcm_handle_, buffer.data(), block_size_);
        if (err < 0) {
            AudioLogger::instance().log_event("XRUN", static_cast<float>(err));
            recover_pcm(static_cast<int>(err));
        }
    }

    if (snd_pcm_drain(pcm_handle_) < 0) {
        AudioLogger::instance().log_message("ALSA", "Drain failed");
    }
}

void AlsaDriver::recover_pcm(int err) {
    if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err >= 0) {
            return;
        }
    } else if (err != -EPIPE) {
        return;
    }

    if (snd_pcm_prepare(pcm_handle_) < 0) {
        AudioLogger::instance().log_message("ALSA", "Recovery failed");
    }
}

} // namespace pcmflow::hal
