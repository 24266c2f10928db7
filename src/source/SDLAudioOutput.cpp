/*
 * SyncPlayerCore - An audio/video playback and recording core.
 * Copyright (C) 2025 Kovey <zzwaaa0396@qq.com>
 *
 * This file is part of SyncPlayerCore.
 *
 * SyncPlayerCore is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "../include/SDLAudioOutput.h"
#include <iostream>

SDLAudioOutput::SDLAudioOutput(double queueLimit) : m_queue_limit(queueLimit) {
    SDL_zero(m_actual_spec);
}

SDLAudioOutput::~SDLAudioOutput() {
    close();
}

bool SDLAudioOutput::open(int sampleRate, int channels) {
    if (channels <= 0 || sampleRate <= 0) {
        std::cerr << "SDLAudioOutput: open called with invalid audio parameters. "
            << "Channels: " << channels << ", SampleRate: " << sampleRate << std::endl;
        return false;
    }

    if (m_audio_device_id != 0) {
        std::cerr << "SDLAudioOutput: Already opened." << std::endl;
        return true;
    }

    if (!SDL_WasInit(SDL_INIT_AUDIO) && SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        std::cerr << "SDLAudioOutput: SDL audio subsystem could not be initialized: " << SDL_GetError() << std::endl;
        return false;
    }

    // 1. 设置期望的SDL音频规格
    SDL_AudioSpec wanted_spec;
    SDL_zero(wanted_spec);
    wanted_spec.freq = sampleRate;
    wanted_spec.format = AUDIO_F32SYS;      // 交错排列的 32 位浮点
    wanted_spec.channels = static_cast<Uint8>(channels);
    wanted_spec.silence = 0;
    wanted_spec.samples = 1024;             // 合理的缓冲区大小
    wanted_spec.callback = nullptr;         // 使用Push模式 (SDL_QueueAudio)

    // 2. 打开音频设备；格式必须与请求一致，样本不再二次转换
    SDL_AudioDeviceID id = SDL_OpenAudioDevice(nullptr, 0, &wanted_spec, &m_actual_spec, 0);
    if (id == 0) {
        std::cerr << "SDLAudioOutput: Failed to open audio device: " << SDL_GetError() << std::endl;
        return false;
    }
    std::cout << "SDLAudioOutput: Audio device opened with ID " << id << std::endl;
    std::cout << "SDLAudioOutput: Freq: " << m_actual_spec.freq << " Format: " << m_actual_spec.format
        << " Channels: " << (int)m_actual_spec.channels << std::endl;

    m_bytes_per_second = m_actual_spec.freq * m_actual_spec.channels * SDL_AUDIO_BITSIZE(m_actual_spec.format) / 8;
    m_audio_device_id = id;

    SDL_PauseAudioDevice(id, 0); // 打开后立即开始播放（设备会播放静音，直到有数据送入）
    return true;
}

bool SDLAudioOutput::write(const float* samples, int frames, const std::atomic<bool>& stop) {
    const SDL_AudioDeviceID id = m_audio_device_id;
    if (id == 0 || !samples || frames <= 0) {
        return id != 0;
    }

    // 流量控制：队列中的数据超过上限时，以不超过 5ms 的步长等待，期间检查停止标志
    const Uint32 max_queued_size = static_cast<Uint32>(m_bytes_per_second * m_queue_limit);
    while (SDL_GetQueuedAudioSize(id) > max_queued_size) {
        if (stop || m_audio_device_id == 0) {
            return false;
        }
        SDL_Delay(5);
    }
    if (stop) {
        return false;
    }

    const Uint32 data_size = static_cast<Uint32>(frames) * m_actual_spec.channels * sizeof(float);
    if (SDL_QueueAudio(id, samples, data_size) < 0) {
        std::cerr << "SDLAudioOutput: Failed to queue audio: " << SDL_GetError() << std::endl;
        return false;
    }
    return true;
}

void SDLAudioOutput::flush() {
    if (m_audio_device_id != 0) {
        SDL_ClearQueuedAudio(m_audio_device_id);
    }
}

void SDLAudioOutput::pause(bool paused) {
    if (m_audio_device_id != 0) {
        SDL_PauseAudioDevice(m_audio_device_id, paused ? 1 : 0);
    }
}

double SDLAudioOutput::queuedSeconds() const {
    if (m_audio_device_id == 0 || m_bytes_per_second <= 0) {
        return 0.0;
    }
    return static_cast<double>(SDL_GetQueuedAudioSize(m_audio_device_id)) / m_bytes_per_second;
}

void SDLAudioOutput::close() {
    const SDL_AudioDeviceID id = m_audio_device_id.exchange(0);
    if (id != 0) {
        SDL_PauseAudioDevice(id, 1);
        SDL_CloseAudioDevice(id);
        std::cout << "SDLAudioOutput: Audio device closed." << std::endl;
    }
}
