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
#include <cstdint>
#include <chrono>
#include <mutex>

// 简单 FPS 计数器工具
class FPSCounter {
private:
    std::atomic<int> m_frame_count{ 0 };
    std::atomic<int> m_fps{ 0 };
    std::chrono::steady_clock::time_point m_last_time;
    std::mutex m_mutex;     // 保护 m_last_time

public:
    FPSCounter() {
        m_last_time = std::chrono::steady_clock::now();
    }

    // 在每一帧发布时调用
    void tick() {
        m_frame_count++;
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = std::chrono::steady_clock::now();
        auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_last_time).count();
        if (diff >= 1000) {
            m_fps.store(m_frame_count.exchange(0));
            m_last_time = now;
        }
    }

    int getFPS() const {
        return m_fps.load();
    }
};

// 播放统计，由两个解码线程写入，宿主线程随时读取
struct PlaybackStats {
    // 视频
    std::atomic<int64_t> frames_published{ 0 };    // 发布到帧槽位的帧数
    std::atomic<int64_t> frames_dropped{ 0 };       // 因落后主时钟过多而丢弃的帧数
    std::atomic<int64_t> frames_skipped{ 0 };       // Seek 后为精确落点而跳过的帧数

    // 音频
    std::atomic<int64_t> audio_buffers{ 0 };        // 写入输出设备的缓冲块数
    std::atomic<int64_t> audio_samples{ 0 };        // 写入输出设备的样本帧数

    // A-V 同步：最近一帧视频 pts 与主时钟之差（毫秒，正值表示视频超前）
    std::atomic<double> av_diff_ms{ 0.0 };
    std::atomic<double> video_current_pts{ 0.0 };

    FPSCounter publish_fps;
};
