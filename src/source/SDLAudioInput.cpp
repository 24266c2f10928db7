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

#include "../include/SDLAudioInput.h"
#include <iostream>

SDLAudioInput::SDLAudioInput(double overflowSeconds) : m_overflow_seconds(overflowSeconds) {
    SDL_zero(m_actual_spec);
}

SDLAudioInput::~SDLAudioInput() {
    close();
}

bool SDLAudioInput::open(int sampleRate, int channels) {
    if (channels <= 0 || sampleRate <= 0) {
        std::cerr << "SDLAudioInput: open called with invalid audio parameters." << std::endl;
        return false;
    }
    if (m_device_id != 0) {
        return true;
    }

    if (!SDL_WasInit(SDL_INIT_AUDIO) && SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        std::cerr << "SDLAudioInput: SDL audio subsystem could not be initialized: " << SDL_GetError() << std::endl;
        return false;
    }

    SDL_AudioSpec wanted_spec;
    SDL_zero(wanted_spec);
    wanted_spec.freq = sampleRate;
    wanted_spec.format = AUDIO_F32SYS;
    wanted_spec.channels = static_cast<Uint8>(channels);
    wanted_spec.samples = 1024;
    wanted_spec.callback = nullptr;         // 使用 SDL_DequeueAudio 拉取

    m_device_id = SDL_OpenAudioDevice(nullptr, 1, &wanted_spec, &m_actual_spec, 0);
    if (m_device_id == 0) {
        std::cerr << "SDLAudioInput: Failed to open capture device: " << SDL_GetError() << std::endl;
        return false;
    }

    m_bytes_per_frame = m_actual_spec.channels * sizeof(float);
    m_overflow_bytes = static_cast<Uint32>(m_actual_spec.freq * m_overflow_seconds) * m_bytes_per_frame;
    std::cout << "SDLAudioInput: Capture device opened with ID " << m_device_id
        << ", Freq: " << m_actual_spec.freq << " Channels: " << (int)m_actual_spec.channels << std::endl;

    SDL_PauseAudioDevice(m_device_id, 0); // 开始采集
    return true;
}

int SDLAudioInput::read(float* samples, int frames, bool& overflowed, const std::atomic<bool>& stop) {
    overflowed = false;
    if (m_device_id == 0 || !samples || frames <= 0) {
        return 0;
    }

    const Uint32 wanted = static_cast<Uint32>(frames) * m_bytes_per_frame;
    Uint8* out = static_cast<Uint8*>(static_cast<void*>(samples));
    Uint32 got = 0;

    while (got < wanted) {
        if (stop) {
            break;
        }
        const Uint32 queued = SDL_GetQueuedAudioSize(m_device_id);
        if (queued > m_overflow_bytes) {
            overflowed = true;
        }
        if (queued == 0) {
            SDL_Delay(5);
            continue;
        }
        got += SDL_DequeueAudio(m_device_id, out + got, wanted - got);
    }
    return static_cast<int>(got / m_bytes_per_frame);
}

void SDLAudioInput::close() {
    if (m_device_id != 0) {
        SDL_PauseAudioDevice(m_device_id, 1);
        SDL_CloseAudioDevice(m_device_id);
        m_device_id = 0;
        std::cout << "SDLAudioInput: Capture device closed." << std::endl;
    }
}
