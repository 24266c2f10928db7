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

#include <atomic>

/**
 * @class IAudioOutput
 * @brief 音频输出设备接口：接收交错排列的 float32 样本。
 */
class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    /**
     * @brief 打开输出设备。
     * @param sampleRate 采样率。
     * @param channels 声道数。
     * @return 成功返回 true，失败返回 false。
     */
    virtual bool open(int sampleRate, int channels) = 0;

    /**
     * @brief 写入一批样本。设备队列中积压过多时会分小段等待。
     * @param samples 交错排列的样本，长度为 frames * channels。
     * @param frames 样本帧数。
     * @param stop 停止标志；等待期间被置位时立即返回。
     * @return 成功返回 true；设备已关闭、出错或被停止时返回 false。
     */
    virtual bool write(const float* samples, int frames, const std::atomic<bool>& stop) = 0;

    /**
     * @brief 丢弃所有已排队但尚未播放的数据。Seek 时调用。
     */
    virtual void flush() = 0;

    /**
     * @brief 暂停或恢复设备播放。
     */
    virtual void pause(bool paused) = 0;

    /**
     * @brief 设备队列中尚未播放的时长（秒）。
     */
    virtual double queuedSeconds() const = 0;

    /**
     * @brief 关闭设备并释放资源。可重复调用。
     */
    virtual void close() = 0;
};
