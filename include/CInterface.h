/**
 * @file CInterface.h
 * @brief C-compatible API for embedding the playback engine.
 *
 * Handles are opaque and tagged; passing a handle of the wrong kind is
 * rejected. Functions returning int report errors as negative PcmError
 * values.
 */

#ifndef PCMFLOW_C_INTERFACE_H
#define PCMFLOW_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

enum PcmSampleFormat {
    PCM_FORMAT_U8 = 0,
    PCM_FORMAT_I8 = 1,
    PCM_FORMAT_U16 = 2,
    PCM_FORMAT_I16 = 3,
    PCM_FORMAT_I32 = 4,
    PCM_FORMAT_U32 = 5,
    PCM_FORMAT_F32 = 6,
    PCM_FORMAT_F64 = 7
};

enum PcmError {
    PCM_OK = 0,
    PCM_ERR_INVALID = -1,
    PCM_ERR_FORMAT = -2,
    PCM_ERR_MIXER_FULL = -3,
    PCM_ERR_QUEUE_FULL = -4,
    PCM_ERR_NO_DEVICE = -5,
    PCM_ERR_DEVICE = -6,
    PCM_ERR_NOT_FOUND = -7
};

// Opaque handle types
typedef void* PcmStreamHandle;
typedef void* PcmSinkHandle;

// Output stream API
PcmStreamHandle pcm_stream_open_null(unsigned int channels, unsigned int sample_rate,
                                     int sample_format, size_t block_size);
PcmStreamHandle pcm_stream_open_default(const char* config_path);
void pcm_stream_destroy(PcmStreamHandle handle);

/**
 * @brief Render one period of a null-driver stream into @p output.
 *
 * @return Frames written, or a negative PcmError.
 */
int pcm_stream_render(PcmStreamHandle handle, void* output, size_t output_bytes, size_t frames);

// Sink API
PcmSinkHandle pcm_sink_create(PcmStreamHandle stream);
void pcm_sink_destroy(PcmSinkHandle handle);

/**
 * @brief Queue a copy of interleaved PCM bytes in the given format.
 */
int pcm_sink_append_pcm(PcmSinkHandle handle, const void* data, size_t bytes,
                        unsigned int channels, unsigned int sample_rate, int sample_format);
int pcm_sink_append_sine(PcmSinkHandle handle, double frequency, double duration_seconds, float amplitude);
int pcm_sink_skip(PcmSinkHandle handle);
int pcm_sink_stop(PcmSinkHandle handle);
int pcm_sink_pause(PcmSinkHandle handle);
int pcm_sink_resume(PcmSinkHandle handle);
int pcm_sink_set_volume(PcmSinkHandle handle, float volume);
int pcm_sink_set_speed(PcmSinkHandle handle, float speed);

/**
 * @return 1 if playing, 0 if paused or idle, negative on error.
 */
int pcm_sink_is_playing(PcmSinkHandle handle);

/**
 * @return Number of queued sources including the current one, negative on error.
 */
int pcm_sink_len(PcmSinkHandle handle);

int pcm_sink_get_position(PcmSinkHandle handle, double* seconds);

#ifdef __cplusplus
}
#endif

#endif // PCMFLOW_C_INTERFACE_H
