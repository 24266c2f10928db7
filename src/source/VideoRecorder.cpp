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

#include <stdexcept>
#include <iostream>
#include <vector>
#include <cmath>

#include "../include/VideoRecorder.h"
#include "../include/FFmpegMediaEncoder.h"
#include "../include/SDLAudioInput.h"
#include "../include/VideoFrameConverter.h"
#include "../include/SurfaceUtils.h"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
}

using namespace std;

namespace {
    // 入队时统一使用的像素格式
    constexpr Uint32 QUEUE_PIXEL_FORMAT = SDL_PIXELFORMAT_RGBA32;

    string errorString(int errnum) {
        char errbuf[AV_ERROR_MAX_STRING_SIZE];
        av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, errnum);
        return string(errbuf);
    }
}

VideoRecorder::VideoRecorder(const RecorderConfig& config) :
    m_config(config),
    m_queue(config.queueCapacity)
{
    cout << "VideoRecorder: Initializing..." << endl;
    try {
        m_encoder = std::make_unique<FFmpegMediaEncoder>();
        if (m_config.recordAudio) {
            m_audioInput = std::make_unique<SDLAudioInput>();
        }
        init_components();
        cout << "VideoRecorder: Initialized successfully." << endl;
    }
    catch (const std::exception& e) {
        cerr << "VideoRecorder: CRITICAL: Constructor failed: " << e.what() << endl;
        cleanup();
        throw;
    }
}

VideoRecorder::VideoRecorder(const RecorderConfig& config,
                             unique_ptr<IMediaEncoder> encoder,
                             unique_ptr<IAudioInput> audioInput) :
    m_config(config),
    m_encoder(std::move(encoder)),
    m_audioInput(std::move(audioInput)),
    m_queue(config.queueCapacity)
{
    try {
        init_components();
    }
    catch (const std::exception& e) {
        cerr << "VideoRecorder: CRITICAL: Constructor failed: " << e.what() << endl;
        cleanup();
        throw;
    }
}

VideoRecorder::~VideoRecorder() {
    stop();
}

void VideoRecorder::init_components() {
    if (m_config.outputFile.empty()) {
        throw SourceError("Output file name is empty.");
    }
    if (m_config.width <= 0 || m_config.height <= 0 || m_config.frameRate <= 0) {
        throw SourceError("Invalid recording size " + to_string(m_config.width) + "x" + to_string(m_config.height)
            + " @ " + to_string(m_config.frameRate) + " fps.");
    }
    if (m_config.dequeueTimeoutMs <= 0) {
        m_config.dequeueTimeoutMs = 100;
    }
    if (!m_encoder) {
        throw SourceError("No encoder.");
    }
    if (m_config.recordAudio) {
        if (!m_audioInput) {
            throw DeviceError("Audio recording requested without an audio input.");
        }
        if (m_config.frequency <= 0 || m_config.channels <= 0) {
            throw SourceError("Invalid audio parameters.");
        }
    }

    if (!m_encoder->open(m_config)) {
        throw SourceError("Could not open output " + m_config.outputFile + " for encoding.");
    }

    if (m_config.recordAudio && !m_audioInput->open(m_config.frequency, m_config.channels)) {
        throw DeviceError("Could not open the audio capture device.");
    }
}

void VideoRecorder::cleanup() {
    if (m_audioInput) {
        m_audioInput->close();
    }
    if (m_encoder) {
        m_encoder->close();
    }
}

void VideoRecorder::start() {
    if (m_started || m_stopped) {
        cerr << "VideoRecorder Warning: start() ignored, the recorder was already started or stopped." << endl;
        return;
    }
    cout << "VideoRecorder: Starting worker threads..." << endl;
    m_started = true;
    m_startTime = std::chrono::steady_clock::now();

    m_videoThread = SDL_CreateThread(video_thread_entry, "EncodeLoop", this);
    if (!m_videoThread) {
        string error = SDL_GetError();
        stop();
        throw std::runtime_error("Thread Error: Could not create encode thread: " + error);
    }

    if (m_config.recordAudio) {
        m_audioThread = SDL_CreateThread(audio_thread_entry, "CaptureLoop", this);
        if (!m_audioThread) {
            string error = SDL_GetError();
            stop();
            throw std::runtime_error("Thread Error: Could not create audio capture thread: " + error);
        }
    }
    cout << "VideoRecorder: Worker threads started." << endl;
}

void VideoRecorder::stop() {
    lock_guard<mutex> lock(m_stop_mutex);
    if (m_closed) {
        return;
    }

    cout << "VideoRecorder: Stopping..." << endl;
    m_stopped = true;
    m_queue.abort();

    if (m_videoThread) {
        cout << "VideoRecorder: Waiting for encode thread to finish..." << endl;
        SDL_WaitThread(m_videoThread, nullptr);
        m_videoThread = nullptr;
        cout << "VideoRecorder: Encode thread finished." << endl;
    }
    if (m_audioThread) {
        cout << "VideoRecorder: Waiting for audio capture thread to finish..." << endl;
        SDL_WaitThread(m_audioThread, nullptr);
        m_audioThread = nullptr;
        cout << "VideoRecorder: Audio capture thread finished." << endl;
    }

    // 未编码的画面直接丢弃
    m_queue.clear();

    if (m_encoder) {
        int ret = m_encoder->flush();
        if (ret < 0) {
            recordError("Flushing the encoder failed: " + errorString(ret));
        }
    }
    cleanup();
    m_closed = true;
    cout << "VideoRecorder: Stopped. " << m_framesEncoded << " frames encoded, "
        << m_queue.droppedCount() << " dropped." << endl;
}

bool VideoRecorder::writeFrame(SDL_Surface* surface) {
    if (!surface || m_stopped) {
        return false;
    }
    // 拷贝一份，调用者可以立刻复用自己的 surface
    SurfacePtr copy = copySurface(surface, 0, 0, QUEUE_PIXEL_FORMAT);
    if (!copy) {
        cerr << "VideoRecorder Error: Could not copy the frame: " << SDL_GetError() << endl;
        return false;
    }
    return m_queue.push(std::move(copy));
}

string VideoRecorder::lastError() const {
    lock_guard<mutex> lock(m_error_mutex);
    return m_lastError;
}

void VideoRecorder::recordError(const string& message) {
    cerr << "VideoRecorder Error: " << message << endl;
    lock_guard<mutex> lock(m_error_mutex);
    m_lastError = message;
}

// 编解码错误对整个会话是致命的：不再接收新帧，并唤醒等待中的线程。资源仍由 stop() 释放
void VideoRecorder::failSession(const string& message) {
    recordError(message);
    m_stopped = true;
    m_queue.abort();
}

// --- 编码线程 ---

int VideoRecorder::video_thread_entry(void* opaque) {
    return static_cast<VideoRecorder*>(opaque)->video_loop_func();
}

int VideoRecorder::video_loop_func() {
    cout << "VideoRecorder: Encode thread started." << endl;

    VideoFrameConverter converter;
    const AVPixelFormat pix_fmt = m_encoder->videoPixelFormat();
    int64_t last_pts = -1;

    while (!m_stopped) {
        SurfacePtr surface;
        if (!m_queue.pop(surface, m_config.dequeueTimeoutMs)) {
            continue;   // 超时，重新检查停止标志
        }
        if (m_stopped) break;

        // 编码器可能仍引用上一帧，每帧使用新的缓冲区
        AVFrame* frame = av_frame_alloc();
        if (!frame) {
            failSession("Encode thread: Could not allocate frame.");
            break;
        }
        frame->format = pix_fmt;
        frame->width = m_config.width;
        frame->height = m_config.height;
        int ret = av_frame_get_buffer(frame, 0);
        if (ret < 0) {
            av_frame_free(&frame);
            failSession("Encode thread: Could not allocate frame buffer: " + errorString(ret));
            break;
        }

        // 缩放到目标尺寸并转换到编码器像素格式
        ret = converter.toFrame(surface.get(), frame);
        if (ret < 0) {
            av_frame_free(&frame);
            failSession("Encode thread: Could not convert the frame: " + errorString(ret));
            break;
        }

        // pts 由墙钟时间得出，保持严格递增
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_startTime).count();
        int64_t pts = static_cast<int64_t>(std::floor(elapsed * m_config.frameRate));
        if (pts <= last_pts) {
            pts = last_pts + 1;
        }
        frame->pts = pts;
        last_pts = pts;

        ret = m_encoder->encodeVideo(frame);
        av_frame_free(&frame);
        if (ret < 0) {
            failSession("Encode thread: Encoding failed: " + errorString(ret));
            break;
        }
        m_framesEncoded++;
    }

    cout << "VideoRecorder: Encode thread finished." << endl;
    return 0;
}

// --- 音频采集线程 ---

int VideoRecorder::audio_thread_entry(void* opaque) {
    return static_cast<VideoRecorder*>(opaque)->audio_loop_func();
}

int VideoRecorder::audio_loop_func() {
    cout << "VideoRecorder: Audio capture thread started." << endl;

    const int channels = m_config.channels;
    const int frame_size = m_encoder->audioFrameSize();
    if (frame_size <= 0) {
        recordError("Audio capture thread: Encoder has no audio stream.");
        return -1;
    }
    vector<float> interleaved(static_cast<size_t>(frame_size) * channels);
    int64_t sample_count = 0;

    while (!m_stopped) {
        bool overflowed = false;
        const int read = m_audioInput->read(interleaved.data(), frame_size, overflowed, m_stopped);
        if (overflowed) {
            // 采集积压说明编码跟不上，录音到此为止，视频继续
            recordError("Audio capture thread: Audio capture overflowed.");
            break;
        }
        if (read < 0) {
            recordError("Audio capture thread: Reading from the capture device failed.");
            break;
        }
        if (read == 0 || m_stopped) {
            continue;
        }

        AVFrame* frame = av_frame_alloc();
        if (!frame) {
            failSession("Audio capture thread: Could not allocate frame.");
            break;
        }
        frame->format = AV_SAMPLE_FMT_FLTP;
        frame->sample_rate = m_config.frequency;
        frame->nb_samples = read;
        if (av_channel_layout_from_string(&frame->ch_layout, m_config.channelLayout.c_str()) < 0
            || frame->ch_layout.nb_channels != channels) {
            av_channel_layout_uninit(&frame->ch_layout);
            av_channel_layout_default(&frame->ch_layout, channels);
        }
        int ret = av_frame_get_buffer(frame, 0);
        if (ret < 0) {
            av_frame_free(&frame);
            failSession("Audio capture thread: Could not allocate frame buffer: " + errorString(ret));
            break;
        }

        // 交错 -> 平面
        for (int c = 0; c < channels; ++c) {
            float* plane = static_cast<float*>(static_cast<void*>(frame->extended_data[c]));
            for (int i = 0; i < read; ++i) {
                plane[i] = interleaved[static_cast<size_t>(i) * channels + c];
            }
        }
        frame->pts = sample_count;
        sample_count += read;

        ret = m_encoder->encodeAudio(frame);
        av_frame_free(&frame);
        if (ret < 0) {
            failSession("Audio capture thread: Encoding failed: " + errorString(ret));
            break;
        }
        m_audioSamples += read;
    }

    cout << "VideoRecorder: Audio capture thread finished." << endl;
    return 0;
}
