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
#include <atomic>
#include <memory>
#include <mutex>
#include <chrono>
#include <cstdint>

#include "SDL2/SDL.h"
#include "SDL2/SDL_thread.h"

#include "PlayerConfig.h"
#include "PlayerErrors.h"
#include "FrameQueue.h"
#include "IMediaEncoder.h"
#include "IAudioInput.h"

/**
 * @class VideoRecorder
 * @brief 把宿主渲染出的画面（以及可选的麦克风音频）编码进输出文件。
 *
 * writeFrame() 只做拷贝与入队，从不阻塞调用者的渲染循环；队列满时丢弃最旧的画面。
 * 编码线程按墙钟时间为每一帧计算 pts，音频采集线程按累计样本数计算 pts。
 */
class VideoRecorder {
public:
    /**
     * @brief 使用 FFmpeg 编码器与 SDL 采集设备。
     * @throws SourceError 输出文件无法创建或编码器不可用
     * @throws DeviceError 需要录音但采集设备无法打开
     */
    explicit VideoRecorder(const RecorderConfig& config);

    /**
     * @brief 使用外部提供的编码器与音频输入（recordAudio 为 false 时 audioInput 可以为空）。
     */
    VideoRecorder(const RecorderConfig& config,
                  std::unique_ptr<IMediaEncoder> encoder,
                  std::unique_ptr<IAudioInput> audioInput);

    ~VideoRecorder();

    VideoRecorder(const VideoRecorder&) = delete;
    VideoRecorder& operator=(const VideoRecorder&) = delete;

    void start();

    /**
     * @brief 停止录制：等待线程退出，冲洗编码器，写入文件尾。可重复调用。
     * 队列中尚未编码的画面被丢弃。
     */
    void stop();

    /**
     * @brief 拷贝 surface 并入队。start() 之前也可以调用。
     * @return surface 为空、拷贝失败或已经停止时返回 false
     */
    bool writeFrame(SDL_Surface* surface);

    // --- 只读属性 ---
    const std::string& outputFile() const { return m_config.outputFile; }
    int width() const { return m_config.width; }
    int height() const { return m_config.height; }
    int fps() const { return m_config.frameRate; }
    const std::string& videoCodec() const { return m_config.videoCodec; }
    const std::string& pixelFormat() const { return m_config.pixelFormat; }
    const std::string& audioCodec() const { return m_config.audioCodec; }
    int frequency() const { return m_config.frequency; }
    int channels() const { return m_config.channels; }
    const std::string& channelLayout() const { return m_config.channelLayout; }
    bool recordAudio() const { return m_config.recordAudio; }
    bool isStopped() const { return m_stopped; }
    int64_t framesEncoded() const { return m_framesEncoded; }
    int64_t framesDropped() const { return m_queue.droppedCount(); }
    int64_t audioSamplesEncoded() const { return m_audioSamples; }
    size_t queuedFrames() const { return m_queue.size(); }
    std::string lastError() const;

private:
    static int video_thread_entry(void* opaque);
    int video_loop_func();
    static int audio_thread_entry(void* opaque);
    int audio_loop_func();

    void init_components();
    void cleanup();
    void recordError(const std::string& message);
    void failSession(const std::string& message);

    RecorderConfig m_config;
    std::unique_ptr<IMediaEncoder> m_encoder;
    std::unique_ptr<IAudioInput> m_audioInput;
    FrameQueue m_queue;

    std::atomic<bool> m_started{ false };
    std::atomic<bool> m_stopped{ false };
    std::atomic<bool> m_closed{ false };
    std::atomic<int64_t> m_framesEncoded{ 0 };
    std::atomic<int64_t> m_audioSamples{ 0 };
    std::chrono::steady_clock::time_point m_startTime;

    std::mutex m_stop_mutex;
    mutable std::mutex m_error_mutex;
    std::string m_lastError;

    SDL_Thread* m_videoThread = nullptr;
    SDL_Thread* m_audioThread = nullptr;
};
