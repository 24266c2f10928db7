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

// 测试用的协作者替身：合成解码帧的游标、实时消耗样本的音频输出、
// 恒定样本的音频输入、记录调用的编码器。

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "../src/include/IFrameSource.h"
#include "../src/include/IAudioOutput.h"
#include "../src/include/IAudioInput.h"
#include "../src/include/IMediaEncoder.h"

extern "C" {
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
}

/**
 * 视频游标：第 i 帧为 RGB24，R 通道填 i % 256，pts = i（时间基 1/fps）。
 * 音频游标：fltp，每帧 samplesPerFrame 个样本，值恒为 value。
 * 默认每一帧都是关键帧，seek(t) 定位到 t 所在的帧；setKeyframeInterval(k) 之后
 * 视频 seek 落在 t 之前最近的关键帧（序号为 k 的倍数），和真实的 GOP 一样。
 */
class FakeFrameSource : public IFrameSource {
public:
    static std::unique_ptr<FakeFrameSource> video(int frames, int fps, int width = 64, int height = 48) {
        std::unique_ptr<FakeFrameSource> source(new FakeFrameSource());
        source->m_type = AVMEDIA_TYPE_VIDEO;
        source->m_count = frames;
        source->m_info.hasStream = true;
        source->m_info.frameRate = AVRational{ fps, 1 };
        source->m_info.timeBase = AVRational{ 1, fps };
        source->m_info.duration = static_cast<double>(frames) / fps;
        source->m_info.width = width;
        source->m_info.height = height;
        return source;
    }

    static std::unique_ptr<FakeFrameSource> audio(double seconds, int sampleRate = 44100, int channels = 2,
                                                  float value = 0.5f, int samplesPerFrame = 1024) {
        std::unique_ptr<FakeFrameSource> source(new FakeFrameSource());
        source->m_type = AVMEDIA_TYPE_AUDIO;
        source->m_samplesPerFrame = samplesPerFrame;
        source->m_value = value;
        source->m_count = static_cast<int>(std::ceil(seconds * sampleRate / samplesPerFrame));
        source->m_info.hasStream = true;
        source->m_info.timeBase = AVRational{ 1, sampleRate };
        source->m_info.duration = seconds;
        source->m_info.sampleRate = sampleRate;
        source->m_info.channels = channels;
        return source;
    }

    // 读到第 index 帧时返回解码错误
    void failAt(int index) { m_failAt = index; }
    void setHasStream(bool has) { m_info.hasStream = has; }
    void setKeyframeInterval(int interval) { m_keyframeInterval = interval > 0 ? interval : 1; }

    bool open(const std::string&) override { return true; }
    bool openMemory(MediaBuffer) override { return true; }
    StreamInfo info() const override { return m_info; }
    AVRational timeBase() const override { return m_info.timeBase; }

    int readFrame(AVFrame* frame) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        av_frame_unref(frame);
        if (m_closed) {
            return AVERROR(EINVAL);
        }
        if (m_cursor == m_failAt) {
            return AVERROR_INVALIDDATA;
        }
        if (m_cursor >= m_count) {
            return AVERROR_EOF;
        }
        const int index = m_cursor++;
        ++m_reads;
        return m_type == AVMEDIA_TYPE_VIDEO ? fillVideo(frame, index) : fillAudio(frame, index);
    }

    bool seek(double seconds) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_seeks;
        if (m_type == AVMEDIA_TYPE_VIDEO) {
            const int target = static_cast<int>(std::floor(seconds * av_q2d(m_info.frameRate) + 1e-9));
            m_cursor = target - target % m_keyframeInterval;
        }
        else {
            m_cursor = static_cast<int>(std::floor(seconds * m_info.sampleRate / m_samplesPerFrame));
        }
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }

    int seekCount() const { std::lock_guard<std::mutex> lock(m_mutex); return m_seeks; }
    int readCount() const { std::lock_guard<std::mutex> lock(m_mutex); return m_reads; }
    bool isClosed() const { std::lock_guard<std::mutex> lock(m_mutex); return m_closed; }

private:
    FakeFrameSource() = default;

    int fillVideo(AVFrame* frame, int index) {
        frame->format = AV_PIX_FMT_RGB24;
        frame->width = m_info.width;
        frame->height = m_info.height;
        int ret = av_frame_get_buffer(frame, 0);
        if (ret < 0) {
            return ret;
        }
        const uint8_t red = static_cast<uint8_t>(index % 256);
        for (int y = 0; y < frame->height; ++y) {
            uint8_t* row = frame->data[0] + y * frame->linesize[0];
            for (int x = 0; x < frame->width; ++x) {
                row[x * 3] = red;
                row[x * 3 + 1] = 0;
                row[x * 3 + 2] = 0;
            }
        }
        frame->pts = index;
        return 0;
    }

    int fillAudio(AVFrame* frame, int index) {
        frame->format = AV_SAMPLE_FMT_FLTP;
        frame->sample_rate = m_info.sampleRate;
        frame->nb_samples = m_samplesPerFrame;
        av_channel_layout_default(&frame->ch_layout, m_info.channels);
        int ret = av_frame_get_buffer(frame, 0);
        if (ret < 0) {
            return ret;
        }
        for (int c = 0; c < m_info.channels; ++c) {
            float* plane = static_cast<float*>(static_cast<void*>(frame->extended_data[c]));
            for (int i = 0; i < m_samplesPerFrame; ++i) {
                plane[i] = m_value;
            }
        }
        frame->pts = static_cast<int64_t>(index) * m_samplesPerFrame;
        return 0;
    }

    mutable std::mutex m_mutex;
    AVMediaType m_type = AVMEDIA_TYPE_VIDEO;
    StreamInfo m_info;
    int m_count = 0;
    int m_cursor = 0;
    int m_failAt = -1;
    int m_keyframeInterval = 1;
    int m_samplesPerFrame = 1024;
    float m_value = 0.5f;
    int m_seeks = 0;
    int m_reads = 0;
    bool m_closed = false;
};

/**
 * 记录写入内容并按采样率实时“播放”的音频输出。暂停时写入挂起，直到恢复或 stop 置位。
 */
class FakeAudioOutput : public IAudioOutput {
public:
    explicit FakeAudioOutput(bool openResult = true) : m_openResult(openResult) {}

    bool open(int sampleRate, int channels) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_rate = sampleRate;
        m_channels = channels;
        m_open = m_openResult;
        return m_openResult;
    }

    bool write(const float* samples, int frames, const std::atomic<bool>& stop) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_open || m_failWrites) {
                return false;
            }
        }
        double remaining = static_cast<double>(frames) / m_rate;
        while (remaining > 0.0) {
            if (stop) {
                return false;
            }
            if (m_paused) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            remaining -= 0.002;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buffers.emplace_back(samples, samples + static_cast<size_t>(frames) * m_channels);
        return true;
    }

    void flush() override { ++m_flushes; }
    void pause(bool paused) override { m_paused = paused; }
    double queuedSeconds() const override { return 0.0; }

    void close() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = false;
        ++m_closes;
    }

    // 之后的写入全部失败，模拟设备被拔出
    void failWrites() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failWrites = true;
    }

    std::vector<std::vector<float>> buffers() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_buffers;
    }
    size_t bufferCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_buffers.size();
    }
    int openedRate() const { std::lock_guard<std::mutex> lock(m_mutex); return m_rate; }
    int openedChannels() const { std::lock_guard<std::mutex> lock(m_mutex); return m_channels; }
    int flushCount() const { return m_flushes; }
    int closeCount() const { std::lock_guard<std::mutex> lock(m_mutex); return m_closes; }
    bool isPaused() const { return m_paused; }

private:
    mutable std::mutex m_mutex;
    bool m_openResult;
    bool m_open = false;
    bool m_failWrites = false;
    int m_rate = 44100;
    int m_channels = 2;
    int m_closes = 0;
    std::atomic<int> m_flushes{ 0 };
    std::atomic<bool> m_paused{ false };
    std::vector<std::vector<float>> m_buffers;
};

/**
 * 实时产出恒定样本的音频输入。overflowAfter 次读取之后报告溢出。
 */
class FakeAudioInput : public IAudioInput {
public:
    explicit FakeAudioInput(int overflowAfter = -1, float value = 0.25f)
        : m_overflowAfter(overflowAfter), m_value(value) {}

    bool open(int sampleRate, int channels) override {
        m_rate = sampleRate;
        m_channels = channels;
        m_open = true;
        return true;
    }

    int read(float* samples, int frames, bool& overflowed, const std::atomic<bool>& stop) override {
        overflowed = false;
        if (!m_open) {
            return -1;
        }
        if (m_overflowAfter >= 0 && m_reads >= m_overflowAfter) {
            overflowed = true;
            return 0;
        }
        const auto duration = std::chrono::microseconds(static_cast<int64_t>(1e6 * frames / m_rate));
        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (std::chrono::steady_clock::now() < deadline) {
            if (stop) {
                return 0;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        for (int i = 0; i < frames * m_channels; ++i) {
            samples[i] = m_value;
        }
        ++m_reads;
        return frames;
    }

    void close() override {
        m_open = false;
        ++m_closes;
    }

    int readCount() const { return m_reads; }
    int closeCount() const { return m_closes; }

private:
    int m_overflowAfter;
    float m_value;
    int m_rate = 44100;
    int m_channels = 2;
    std::atomic<bool> m_open{ false };
    std::atomic<int> m_reads{ 0 };
    std::atomic<int> m_closes{ 0 };
};

/**
 * 记录收到的每一帧：视频帧记下 pts 与左上角像素的 R 值（输入格式为 RGBA）。
 */
class FakeMediaEncoder : public IMediaEncoder {
public:
    struct VideoRecord {
        int64_t pts;
        int red;
        int width;
        int height;
    };
    struct AudioRecord {
        int64_t pts;
        int samples;
        float first;
    };

    explicit FakeMediaEncoder(bool openResult = true) : m_openResult(openResult) {}

    bool open(const RecorderConfig& config) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        m_opened = m_openResult;
        return m_openResult;
    }

    AVPixelFormat videoPixelFormat() const override { return AV_PIX_FMT_RGBA; }
    int audioFrameSize() const override { return 1024; }

    int encodeVideo(AVFrame* frame) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failVideo) {
            return AVERROR(EIO);
        }
        m_video.push_back(VideoRecord{ frame->pts, frame->data[0][0], frame->width, frame->height });
        return 0;
    }

    int encodeAudio(AVFrame* frame) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failAudio) {
            return AVERROR(EIO);
        }
        const float first = static_cast<const float*>(static_cast<const void*>(frame->extended_data[0]))[0];
        m_audio.push_back(AudioRecord{ frame->pts, frame->nb_samples, first });
        return 0;
    }

    int flush() override { ++m_flushes; return 0; }

    void close() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_opened = false;
        ++m_closes;
    }

    void failVideo() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failVideo = true;
    }

    void failAudio() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failAudio = true;
    }

    std::vector<VideoRecord> video() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_video;
    }
    std::vector<AudioRecord> audio() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_audio;
    }
    int flushCount() const { return m_flushes; }
    int closeCount() const { std::lock_guard<std::mutex> lock(m_mutex); return m_closes; }

private:
    mutable std::mutex m_mutex;
    bool m_openResult;
    bool m_opened = false;
    bool m_failVideo = false;
    bool m_failAudio = false;
    RecorderConfig m_config;
    std::vector<VideoRecord> m_video;
    std::vector<AudioRecord> m_audio;
    std::atomic<int> m_flushes{ 0 };
    int m_closes = 0;
};

// 轮询 predicate，直到为真或超时
template <typename Predicate>
bool waitUntil(Predicate predicate, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}
