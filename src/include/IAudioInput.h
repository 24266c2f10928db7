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
 * @class IAudioInput
 * @brief 音频采集设备接口：产出交错排列的 float32 样本。
 */
class IAudioInput {
public:
    virtual ~IAudioInput() = default;

    /**
     * @brief 打开采集设备并开始采集。
     * @return 成功返回 true，失败返回 false。
     */
    virtual bool open(int sampleRate, int channels) = 0;

    /**
     * @brief 阻塞读取 frames 个样本帧。
     * @param samples 输出缓冲，长度至少为 frames * channels。
     * @param frames 需要的样本帧数。
     * @param overflowed 输出参数：采集端积压的数据超过了设备缓冲，部分数据已丢失。
     * @param stop 停止标志；等待期间被置位时立即返回。
     * @return 实际读取的样本帧数；被停止或设备出错时小于 frames。
     */
    virtual int read(float* samples, int frames, bool& overflowed, const std::atomic<bool>& stop) = 0;

    /**
     * @brief 停止采集并关闭设备。可重复调用。
     */
    virtual void close() = 0;
};
