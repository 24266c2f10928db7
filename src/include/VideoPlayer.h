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

#include <string>
#include <vector>
#include <atomic>
#include <memory>
#include <mutex>
#include <functional>
#include <cstdint>

#include "SDL2/SDL.h"
#include "SDL2/SDL_thread.h"

#include "PlayerConfig.h"
#include "PlayerErrors.h"
#include "IFrameSource.h"
#include "IAudioOutput.h"
#include "PresentationClock.h"
#include "PauseGate.h"
#include "FrameSlot.h"
#include "PlaybackStats.h"

/**
 * @class VideoPlayer
 * @brief 音视频同步播放核心。
 *
 * 视频与音频各由一个解码线程驱动，两者通过三个共享单元协作：
 * 主时钟（PresentationClock）、暂停闸门（PauseGate）与最新帧槽位（FrameSlot）。
 * 音频线程推进主时钟，视频线程参照它休眠或丢帧；没有音频时视频线程自己计时并写时钟。
 * 宿主渲染循环随时调用 getFrame() 取得最新画面，该调用从不阻塞。
 *
 * 线程模型：所有公开方法可以在任意线程调用；stop() 之后的传输控制操作均为空操作。
 */
class VideoPlayer {
public:
    // 每发布一帧调用一次：(帧序号, 媒体时间秒)。在解码线程中调用，不应阻塞，也不能调用 stop()/move()/togglePause()。
    using FrameCallback = std::function<void(int64_t, double)>;

    /**
     * @brief 打开本地文件或 URL（包含 "://" 的字符串按 URL 处理）。
     * @throws SourceError 文件不存在、无法打开、没有视频流或编解码器不受支持
     * @throws DeviceError 音频设备无法打开且 config.tolerateAudioFailure 为 false
     */
    explicit VideoPlayer(const std::string& source, const PlayerConfig& config = PlayerConfig());

    /**
     * @brief 从内存中的媒体数据打开。
     */
    explicit VideoPlayer(std::vector<uint8_t> bytes, const PlayerConfig& config = PlayerConfig());

    /**
     * @brief 使用外部提供的解码游标与输出设备（游标需已打开）。音频部分可以为空。
     */
    VideoPlayer(std::unique_ptr<IFrameSource> videoSource,
                std::unique_ptr<IFrameSource> audioSource,
                std::unique_ptr<IAudioOutput> audioOutput,
                const PlayerConfig& config = PlayerConfig());

    ~VideoPlayer();

    VideoPlayer(const VideoPlayer&) = delete;
    VideoPlayer& operator=(const VideoPlayer&) = delete;

    /**
     * @brief 启动解码线程。每个会话只能调用一次，重复调用或 stop() 之后调用会被忽略。
     * @throws std::runtime_error 线程创建失败
     */
    void start();

    /**
     * @brief 停止播放：唤醒暂停中的线程，等待两个解码线程退出，再关闭设备与解码器。
     * 可重复调用，第二次调用不做任何事。
     */
    void stop();

    void togglePause();

    // 音量，钳制到 [0, 1]，下一批音频样本立即生效
    void setVolume(double volume);
    void increaseVolume(double delta);
    void decreaseVolume(double delta);

    // 播放速度，钳制到 [minSpeed, maxSpeed]
    void setPlaybackSpeed(double speed);
    void increasePlaybackSpeed(double delta);
    void decreasePlaybackSpeed(double delta);

    /**
     * @brief 跳转到 seconds（钳制到 [0, duration]）。暂停状态在跳转前后保持不变。
     */
    void move(double seconds);
    void forward(double seconds);
    void rewind(double seconds);

    // 以帧为单位跳转
    void moveFrame(int64_t frameIndex);
    void forwardFrame(int64_t frames = 1);
    void rewindFrame(int64_t frames = 1);

    /**
     * @brief 取得最新画面的拷贝。width/height 为 0 时返回原尺寸。从不等待新帧。
     */
    SurfacePtr getFrame(int width = 0, int height = 0);

    void setFrameCallback(FrameCallback callback);

    // --- 只读属性 ---
    double fps() const { return m_fps; }
    double duration() const { return m_duration; }
    int width() const { return m_width; }
    int height() const { return m_height; }
    bool isPaused() const { return m_paused; }
    bool isStopped() const { return m_stopped; }
    bool hasAudio() const { return m_hasAudio; }
    double volume() const { return m_volume; }
    double speed() const { return m_speed; }
    int loopLimit() const { return m_config.loop; }
    double position() const { return m_clock.seconds(); }
    int64_t currentFrameIndex() const { return m_currentFrameIndex; }
    int videoLoopCount() const { return m_videoLoopCount; }
    int audioLoopCount() const { return m_audioLoopCount; }
    bool isFrameFresh() const { return m_slot.isFresh(); }
    const PlaybackStats& stats() const { return m_stats; }
    std::string lastError() const;

private:
    // 线程入口函数（静态入口 + 实际逻辑，兼容 SDL API）
    static int video_thread_entry(void* opaque);
    int video_loop_func();
    static int audio_thread_entry(void* opaque);
    int audio_loop_func();

    // 构造辅助
    void openFromUrl(const std::string& source);
    void openFromMemory(MediaBuffer buffer);
    void init_components();
    void init_audio_output();
    void cleanup();

    // 闸门控制：关闭时先关闸门再置中断标志，打开时顺序相反
    void closeGate();
    void openGate();
    bool waitForLoopsParked();

    // Seek 的实际操作，调用者持有 m_control_mutex 且解码线程未在读取游标
    void seekCursors(double seconds);
    void decodePreviewFrame(double target);

    // 视频线程辅助：在暂停时停靠，返回是否真的停靠过
    bool parkIfPaused();
    // 音频读完后等待下一次 Seek；会话停止时返回 false
    bool waitForSeekAfterAudioEnd(int serial);
    void publishFrame(SurfacePtr surface, int64_t index, double pts);
    void recordError(const std::string& message);
    void markStopped();
    bool shouldContinueLoop(int loopCount) const;

    PlayerConfig m_config;

    // 解码游标与输出设备
    std::unique_ptr<IFrameSource> m_videoSource;
    std::unique_ptr<IFrameSource> m_audioSource;
    std::unique_ptr<IAudioOutput> m_audioOutput;

    // 媒体属性
    double m_fps = 0.0;
    double m_frameDuration = 0.0;
    double m_duration = 0.0;
    int m_width = 0;
    int m_height = 0;
    int m_audioChannels = 0;
    AVRational m_frameRate{ 0, 1 };
    AVRational m_videoTimeBase{ 0, 1 };
    AVRational m_audioTimeBase{ 0, 1 };

    // 共享单元
    PresentationClock m_clock;
    PauseGate m_gate;
    FrameSlot m_slot;
    PlaybackStats m_stats;

    // 会话状态
    std::atomic<bool> m_started{ false };
    std::atomic<bool> m_stopped{ false };
    std::atomic<bool> m_closed{ false };        // stop() 已完成资源释放
    std::atomic<bool> m_paused{ false };
    std::atomic<bool> m_hasAudio{ false };
    std::atomic<bool> m_audioActive{ false };   // 音频线程仍在推进主时钟
    std::atomic<bool> m_audioInterrupt{ false };// 让阻塞中的音频写入尽快返回（暂停/Seek/停止）
    std::atomic<double> m_volume{ 1.0 };
    std::atomic<double> m_speed{ 1.0 };
    std::atomic<int> m_videoLoopCount{ 0 };
    std::atomic<int> m_audioLoopCount{ 0 };
    std::atomic<int> m_runningLoops{ 0 };
    std::atomic<int> m_seek_serial{ 0 };        // 每次 Seek 加一，线程据此丢弃 Seek 前持有的帧
    std::atomic<int64_t> m_currentFrameIndex{ 0 };

    // Seek 之后，pts 早于该时间的帧只解码不显示（-1 表示无）
    std::atomic<double> m_videoSkipUntil{ -1.0 };
    std::atomic<double> m_audioSkipUntil{ -1.0 };

    std::mutex m_control_mutex;     // 串行化 Seek / 暂停 / 停止时的资源释放
    std::mutex m_stop_mutex;
    mutable std::mutex m_error_mutex;
    std::string m_lastError;
    std::mutex m_callback_mutex;
    FrameCallback m_frameCallback;

    // 内部线程句柄
    SDL_Thread* m_videoThread = nullptr;
    SDL_Thread* m_audioThread = nullptr;
};
