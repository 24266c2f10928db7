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

#pragma once

#include "IAudioInput.h"
#include <SDL2/SDL.h>

/**
 * @class SDLAudioInput
 * @brief 基于 SDL 采集设备（SDL_DequeueAudio）的 float32 音频输入。
 *
 * SDL 把采集到的数据排在设备队列中，积压超过 overflowSeconds 秒即视为溢出。
 */
class SDLAudioInput : public IAudioInput {
public:
    explicit SDLAudioInput(double overflowSeconds = 2.0);
    ~SDLAudioInput() override;

    SDLAudioInput(const SDLAudioInput&) = delete;
    SDLAudioInput& operator=(const SDLAudioInput&) = delete;

    bool open(int sampleRate, int channels) override;
    int read(float* samples, int frames, bool& overflowed, const std::atomic<bool>& stop) override;
    void close() override;

private:
    SDL_AudioDeviceID m_device_id = 0;
    SDL_AudioSpec m_actual_spec;
    Uint32 m_bytes_per_frame = 0;
    Uint32 m_overflow_bytes = 0;
    double m_overflow_seconds;
};
