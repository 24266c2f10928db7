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

#include "IAudioOutput.h"
#include <SDL2/SDL.h>
#include <atomic>

/**
 * @class SDLAudioOutput
 * @brief 基于 SDL 推送模式（SDL_QueueAudio）的 float32 输出设备。
 *
 * 设备队列中积压的数据被限制在 queueLimit 秒以内，这样音频线程写入的节奏
 * 接近真实播放速度，音频时钟不会跑到实际声音前面太多，Seek 后也能更快听到新位置。
 */
class SDLAudioOutput : public IAudioOutput {
public:
    explicit SDLAudioOutput(double queueLimit = 0.1);
    ~SDLAudioOutput() override;

    // 禁用拷贝构造和赋值
    SDLAudioOutput(const SDLAudioOutput&) = delete;
    SDLAudioOutput& operator=(const SDLAudioOutput&) = delete;

    bool open(int sampleRate, int channels) override;
    bool write(const float* samples, int frames, const std::atomic<bool>& stop) override;
    void flush() override;
    void pause(bool paused) override;
    double queuedSeconds() const override;
    void close() override;

private:
    std::atomic<SDL_AudioDeviceID> m_audio_device_id{ 0 };
    SDL_AudioSpec m_actual_spec; // SDL实际打开的音频规格
    int m_bytes_per_second = 0;
    double m_queue_limit;
};
