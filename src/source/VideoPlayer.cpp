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

#include <fstream>      // 文件路径验证
#include <stdexcept>    // std::runtime_error
#include <chrono>
#include <cmath>
#include <algorithm>
#include <iostream>

#include "../include/VideoPlayer.h"
#include "../include/FFmpegFrameSource.h"
#include "../include/SDLAudioOutput.h"
#include "../include/VideoFrameConverter.h"
#include "../include/AudioResampler.h"
#include "../include/AudioMixer.h"

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

using namespace std;

namespace {
    const int PARK_POLL_MS = 20;            // Seek 等待解码线程停靠时的轮询间隔
    const double SELF_PACE_SLICE = 0.005;   // 视频自计时时单次休眠的上限（秒）
    const double DEFAULT_FPS = 25.0;

    using SteadyClock = std::chrono::steady_clock;

    string errorString(int errnum) {
        char errbuf[AV_ERROR_MAX_STRING_SIZE];
        av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, errnum);
        return string(errbuf);
    }

    bool isUrl(const string& source) {
        return source.find("://") != string::npos;
    }

    bool fileExists(const string& path) {
        ifstream file(path, ios::binary);
        return file.good();
    }

    // 休眠 seconds 秒，至少 1 毫秒
    void sleepFor(double seconds) {
        Uint32 ms = static_cast<Uint32>(std::max(1.0, seconds * 1000.0));
        SDL_Delay(ms);
    }

    double secondsSince(SteadyClock::time_point start) {
        return std::chrono::duration<double>(SteadyClock::now() - start).count();
    }
}

// --- 构造与析构 ---

VideoPlayer::VideoPlayer(const string& source, const PlayerConfig& config) :
    m_config(config)
{
    cout << "VideoPlayer: Opening " << source << endl;
    try {
        openFromUrl(source);
        init_components();
        cout << "VideoPlayer: Initialized successfully." << endl;
    }
    catch (const std::exception& e) {
        cerr << "VideoPlayer: CRITICAL: Constructor failed: " << e.what() << endl;
        cleanup();
        throw;
    }
}

VideoPlayer::VideoPlayer(vector<uint8_t> bytes, const PlayerConfig& config) :
    m_config(config)
{
    cout << "VideoPlayer: Opening in-memory media (" << bytes.size() << " bytes)" << endl;
    try {
        // 两个游标共享同一份只读数据，各自维护读取位置
        MediaBuffer buffer = std::make_shared<const vector<uint8_t>>(std::move(bytes));
        openFromMemory(buffer);
        init_components();
        cout << "VideoPlayer: Initialized successfully." << endl;
    }
    catch (const std::exception& e) {
        cerr << "VideoPlayer: CRITICAL: Constructor failed: " << e.what() << endl;
        cleanup();
        throw;
    }
}

VideoPlayer::VideoPlayer(unique_ptr<IFrameSource> videoSource,
                         unique_ptr<IFrameSource> audioSource,
                         unique_ptr<IAudioOutput> audioOutput,
                         const PlayerConfig& config) :
    m_config(config),
    m_videoSource(std::move(videoSource)),
    m_audioSource(std::move(audioSource)),
    m_audioOutput(std::move(audioOutput))
{
    try {
        init_components();
    }
    catch (const std::exception& e) {
        cerr << "VideoPlayer: CRITICAL: Constructor failed: " << e.what() << endl;
        cleanup();
        throw;
    }
}

VideoPlayer::~VideoPlayer() {
    stop();
}

void VideoPlayer::openFromUrl(const string& source) {
    if (source.empty()) {
        throw SourceError("Input path/URL is empty.");
    }
    if (!isUrl(source) && !fileExists(source)) {
        throw SourceError("File not found: " + source);
    }

    auto video = std::make_unique<FFmpegFrameSource>(AVMEDIA_TYPE_VIDEO);
    if (!video->open(source)) {
        throw SourceError("Could not open a decodable video stream in: " + source);
    }
    m_videoSource = std::move(video);

    // 音频是可选的：打不开就当作没有音频
    auto audio = std::make_unique<FFmpegFrameSource>(AVMEDIA_TYPE_AUDIO);
    if (audio->open(source)) {
        m_audioSource = std::move(audio);
        m_audioOutput = std::make_unique<SDLAudioOutput>(m_config.audioQueueLimit);
    }
    else {
        cout << "VideoPlayer: No audio stream in " << source << ", playing video only." << endl;
    }
}

void VideoPlayer::openFromMemory(MediaBuffer buffer) {
    if (!buffer || buffer->empty()) {
        throw SourceError("In-memory media is empty.");
    }

    auto video = std::make_unique<FFmpegFrameSource>(AVMEDIA_TYPE_VIDEO);
    if (!video->openMemory(buffer)) {
        throw SourceError("Could not open a decodable video stream in the in-memory media.");
    }
    m_videoSource = std::move(video);

    auto audio = std::make_unique<FFmpegFrameSource>(AVMEDIA_TYPE_AUDIO);
    if (audio->openMemory(buffer)) {
        m_audioSource = std::move(audio);
        m_audioOutput = std::make_unique<SDLAudioOutput>(m_config.audioQueueLimit);
    }
    else {
        cout << "VideoPlayer: No audio stream in the in-memory media, playing video only." << endl;
    }
}

void VideoPlayer::init_components() {
    cout << "VideoPlayer: Initializing components..." << endl;

    if (!m_videoSource) {
        throw SourceError("No video source.");
    }
    const StreamInfo info = m_videoSource->info();
    if (!info.hasStream) {
        throw SourceError("Source has no video stream.");
    }

    // 参数钳制
    if (m_config.minSpeed <= 0.0) m_config.minSpeed = 0.1;
    if (m_config.maxSpeed < m_config.minSpeed) m_config.maxSpeed = m_config.minSpeed;
    if (m_config.loop < 0) m_config.loop = 0;
    if (m_config.frequency <= 0) m_config.frequency = 44100;
    if (m_config.syncThreshold <= 0.0) m_config.syncThreshold = 0.005;
    if (m_config.dropThreshold <= 0.0) m_config.dropThreshold = 0.1;
    m_speed = std::min(std::max(m_config.speed, m_config.minSpeed), m_config.maxSpeed);
    m_volume = std::min(std::max(m_config.volume, 0.0), 1.0);

    // 媒体属性
    m_frameRate = info.frameRate;
    m_fps = av_q2d(info.frameRate);
    if (m_fps <= 0.0 || !std::isfinite(m_fps)) {
        cerr << "VideoPlayer Warning: Unknown frame rate, assuming " << DEFAULT_FPS << " fps." << endl;
        m_fps = DEFAULT_FPS;
        m_frameRate = AVRational{ static_cast<int>(DEFAULT_FPS), 1 };
    }
    m_frameDuration = 1.0 / m_fps;
    m_duration = std::max(0.0, info.duration);
    m_width = info.width;
    m_height = info.height;
    m_videoTimeBase = m_videoSource->timeBase();

    if (!m_slot.reset(m_width, m_height)) {
        throw SourceError("Invalid video frame size " + to_string(m_width) + "x" + to_string(m_height) + ".");
    }

    init_audio_output();

    cout << "VideoPlayer: " << m_width << "x" << m_height << " @ " << m_fps << " fps, duration "
        << m_duration << " s, audio: " << (m_hasAudio ? "yes" : "no") << endl;
}

void VideoPlayer::init_audio_output() {
    m_hasAudio = false;

    if (!m_audioSource) {
        cout << "VideoPlayer: No audio source. Skipping audio output initialization." << endl;
        return;
    }
    const StreamInfo info = m_audioSource->info();
    if (!info.hasStream || !m_audioOutput) {
        cout << "VideoPlayer: Audio source unusable. Skipping audio output initialization." << endl;
        m_audioSource->close();
        m_audioSource.reset();
        return;
    }

    // 输出声道数跟随音频流
    m_audioChannels = info.channels > 0 ? info.channels : 2;
    m_audioTimeBase = m_audioSource->timeBase();

    cout << "VideoPlayer: Opening audio output (" << m_config.frequency << " Hz, "
        << m_audioChannels << " channels)..." << endl;
    if (!m_audioOutput->open(m_config.frequency, m_audioChannels)) {
        if (!m_config.tolerateAudioFailure) {
            throw DeviceError("Could not open the audio output device.");
        }
        cerr << "VideoPlayer Warning: Could not open the audio output device, continuing without audio." << endl;
        m_audioSource->close();
        m_audioSource.reset();
        m_audioOutput.reset();
        return;
    }

    m_hasAudio = true;
    cout << "VideoPlayer: Audio output initialized." << endl;
}

void VideoPlayer::cleanup() {
    cout << "VideoPlayer: Cleaning up resources..." << endl;
    if (m_audioOutput) {
        m_audioOutput->close();
        cout << "VideoPlayer: Audio output closed." << endl;
    }
    if (m_audioSource) {
        m_audioSource->close();
        cout << "VideoPlayer: Audio source closed." << endl;
    }
    if (m_videoSource) {
        m_videoSource->close();
        cout << "VideoPlayer: Video source closed." << endl;
    }
}

// --- 生命周期 ---

void VideoPlayer::start() {
    lock_guard<mutex> lock(m_control_mutex);
    if (m_stopped || m_started) {
        cerr << "VideoPlayer Warning: start() ignored, the session was already started or stopped." << endl;
        return;
    }

    cout << "VideoPlayer: Starting worker threads..." << endl;
    m_started = true;
    m_audioActive = m_hasAudio.load();
    m_runningLoops = 0;

    if (m_hasAudio) {
        ++m_runningLoops;
        m_audioThread = SDL_CreateThread(audio_thread_entry, "AudioLoop", this);
        if (!m_audioThread) {
            --m_runningLoops;
            m_audioActive = false;
            string error = SDL_GetError();
            markStopped();
            throw std::runtime_error("Thread Error: Could not create audio thread: " + error);
        }
    }

    ++m_runningLoops;
    m_videoThread = SDL_CreateThread(video_thread_entry, "VideoLoop", this);
    if (!m_videoThread) {
        --m_runningLoops;
        string error = SDL_GetError();
        // 已经启动的音频线程由 stop() 回收
        markStopped();
        m_gate.set();
        throw std::runtime_error("Thread Error: Could not create video thread: " + error);
    }

    cout << "VideoPlayer: Worker threads started." << endl;
}

void VideoPlayer::stop() {
    lock_guard<mutex> stop_lock(m_stop_mutex);
    if (m_closed) {
        return;
    }

    cout << "VideoPlayer: Stopping..." << endl;
    markStopped();
    {
        // 放行停靠在闸门上的线程
        lock_guard<mutex> lock(m_control_mutex);
        m_gate.set();
    }

    if (m_videoThread) {
        cout << "VideoPlayer: Waiting for video thread to finish..." << endl;
        SDL_WaitThread(m_videoThread, nullptr);
        m_videoThread = nullptr;
        cout << "VideoPlayer: Video thread finished." << endl;
    }
    if (m_audioThread) {
        cout << "VideoPlayer: Waiting for audio thread to finish..." << endl;
        SDL_WaitThread(m_audioThread, nullptr);
        m_audioThread = nullptr;
        cout << "VideoPlayer: Audio thread finished." << endl;
    }

    {
        lock_guard<mutex> lock(m_control_mutex);
        cleanup();
    }
    m_closed = true;
    cout << "VideoPlayer: Stopped." << endl;
}

void VideoPlayer::markStopped() {
    m_stopped = true;
    m_audioInterrupt = true;
}

// --- 暂停 ---

void VideoPlayer::closeGate() {
    m_gate.clear();
    m_audioInterrupt = true;
}

void VideoPlayer::openGate() {
    if (!m_stopped) {
        m_audioInterrupt = false;
    }
    m_gate.set();
}

void VideoPlayer::togglePause() {
    lock_guard<mutex> lock(m_control_mutex);
    if (m_stopped) {
        return;
    }

    if (m_paused) {
        m_paused = false;
        if (m_audioOutput && m_hasAudio) {
            m_audioOutput->pause(false);
        }
        openGate();
        cout << "VideoPlayer: Resumed." << endl;
    }
    else {
        m_paused = true;
        closeGate();
        if (m_audioOutput && m_hasAudio) {
            m_audioOutput->pause(true);
        }
        cout << "VideoPlayer: Paused." << endl;
    }
}

bool VideoPlayer::waitForLoopsParked() {
    while (true) {
        if (m_stopped) {
            return false;
        }
        const int running = m_runningLoops;
        if (running <= 0) {
            return true;
        }
        // 线程可能在等待期间退出，因此每轮重新读取运行中的线程数
        if (m_gate.waitForParked(running, PARK_POLL_MS)) {
            return true;
        }
    }
}

bool VideoPlayer::parkIfPaused() {
    return m_gate.wait();
}

bool VideoPlayer::waitForSeekAfterAudioEnd(int serial) {
    // 空闲期间不读取游标，Seek 无需等待本线程停靠
    m_audioActive = false;
    --m_runningLoops;
    while (!m_stopped && m_seek_serial == serial) {
        sleepFor(PARK_POLL_MS / 1000.0);
    }
    {
        // Seek 全程持有控制锁，拿到锁时游标已经定位完毕
        lock_guard<mutex> lock(m_control_mutex);
        ++m_runningLoops;
        if (m_stopped) {
            return false;
        }
    }
    // Seek 到暂停状态时闸门保持关闭，在这里停靠到恢复播放
    parkIfPaused();
    if (m_stopped) {
        return false;
    }
    m_audioActive = m_hasAudio.load();
    cout << "VideoPlayer AudioThread: Resumed after seek." << endl;
    return true;
}

// --- 音量与速度 ---

void VideoPlayer::setVolume(double volume) {
    m_volume = std::min(std::max(volume, 0.0), 1.0);
}

void VideoPlayer::increaseVolume(double delta) {
    setVolume(m_volume + delta);
}

void VideoPlayer::decreaseVolume(double delta) {
    setVolume(m_volume - delta);
}

void VideoPlayer::setPlaybackSpeed(double speed) {
    m_speed = std::min(std::max(speed, m_config.minSpeed), m_config.maxSpeed);
}

void VideoPlayer::increasePlaybackSpeed(double delta) {
    setPlaybackSpeed(m_speed + delta);
}

void VideoPlayer::decreasePlaybackSpeed(double delta) {
    setPlaybackSpeed(m_speed - delta);
}

// --- Seek ---

void VideoPlayer::move(double seconds) {
    lock_guard<mutex> lock(m_control_mutex);
    if (m_stopped) {
        return;
    }

    double target = std::max(0.0, seconds);
    if (m_duration > 0.0) {
        target = std::min(target, m_duration);
    }

    if (!m_started) {
        // 解码线程尚未运行，直接定位游标
        seekCursors(target);
        decodePreviewFrame(target);
        return;
    }

    // 1. 关闭闸门，等待两个解码线程都停靠（不再触碰游标）
    closeGate();
    if (!waitForLoopsParked()) {
        m_gate.set();
        return;
    }

    // 2. 定位游标并重置主时钟
    ++m_seek_serial;
    seekCursors(target);

    // 3. 暂停中的 Seek 立即展示目标帧，闸门保持关闭
    if (m_paused) {
        decodePreviewFrame(target);
    }
    else {
        openGate();
    }
}

void VideoPlayer::seekCursors(double seconds) {
    if (!m_videoSource->seek(seconds)) {
        cerr << "VideoPlayer Warning: Video seek to " << seconds << " s failed." << endl;
    }
    m_videoSkipUntil = seconds > 0.0 ? seconds : -1.0;

    if (m_hasAudio && m_audioSource) {
        if (!m_audioSource->seek(seconds)) {
            cerr << "VideoPlayer Warning: Audio seek to " << seconds << " s failed." << endl;
        }
        m_audioSkipUntil = seconds > 0.0 ? seconds : -1.0;
        if (m_audioOutput) {
            m_audioOutput->flush();
        }
    }

    const int64_t index = llround(seconds * m_fps);
    m_clock.reset(seconds, index);
    m_currentFrameIndex = index;
}

void VideoPlayer::decodePreviewFrame(double target) {
    AVFrame* frame = av_frame_alloc();
    if (!frame) {
        cerr << "VideoPlayer Warning: Could not allocate a frame for the seek preview." << endl;
        return;
    }

    VideoFrameConverter converter;
    const double tb = av_q2d(m_videoTimeBase);
    while (true) {
        // EOF 或解码错误留给视频线程在恢复后处理
        int ret = m_videoSource->readFrame(frame);
        if (ret < 0) {
            break;
        }
        const double pts = frame->pts * tb;
        if (target > 0.0 && pts < target - m_frameDuration / 2) {
            av_frame_unref(frame);
            m_stats.frames_skipped++;
            continue;
        }
        SurfacePtr surface = converter.toSurface(frame);
        if (surface) {
            publishFrame(std::move(surface), llround(pts * m_fps), pts);
        }
        break;
    }
    m_videoSkipUntil = -1.0;
    av_frame_free(&frame);
}

void VideoPlayer::forward(double seconds) {
    move(position() + seconds);
}

void VideoPlayer::rewind(double seconds) {
    move(position() - seconds);
}

void VideoPlayer::moveFrame(int64_t frameIndex) {
    if (frameIndex < 0) {
        frameIndex = 0;
    }
    // 帧序号 -> 流时间基 -> 秒
    double seconds;
    if (m_videoTimeBase.num > 0 && m_videoTimeBase.den > 0 && m_frameRate.num > 0 && m_frameRate.den > 0) {
        int64_t ts = av_rescale_q(frameIndex, av_inv_q(m_frameRate), m_videoTimeBase);
        seconds = ts * av_q2d(m_videoTimeBase);
    }
    else {
        seconds = frameIndex / m_fps;
    }
    move(seconds);
}

void VideoPlayer::forwardFrame(int64_t frames) {
    moveFrame(m_currentFrameIndex + frames);
}

void VideoPlayer::rewindFrame(int64_t frames) {
    moveFrame(m_currentFrameIndex - frames);
}

// --- 帧出口 ---

SurfacePtr VideoPlayer::getFrame(int width, int height) {
    return m_slot.get(width, height);
}

void VideoPlayer::setFrameCallback(FrameCallback callback) {
    lock_guard<mutex> lock(m_callback_mutex);
    m_frameCallback = std::move(callback);
}

void VideoPlayer::publishFrame(SurfacePtr surface, int64_t index, double pts) {
    m_slot.publish(std::move(surface));
    m_currentFrameIndex = index;
    m_stats.frames_published++;
    m_stats.publish_fps.tick();
    m_stats.video_current_pts = pts;

    FrameCallback callback;
    {
        lock_guard<mutex> lock(m_callback_mutex);
        callback = m_frameCallback;
    }
    if (callback) {
        callback(index, pts);
    }
}

string VideoPlayer::lastError() const {
    lock_guard<mutex> lock(m_error_mutex);
    return m_lastError;
}

void VideoPlayer::recordError(const string& message) {
    cerr << "VideoPlayer Error: " << message << endl;
    lock_guard<mutex> lock(m_error_mutex);
    m_lastError = message;
}

bool VideoPlayer::shouldContinueLoop(int loopCount) const {
    return m_config.loop == 0 || loopCount < m_config.loop;
}

// --- 视频线程 ---

int VideoPlayer::video_thread_entry(void* opaque) {
    return static_cast<VideoPlayer*>(opaque)->video_loop_func();
}

int VideoPlayer::video_loop_func() {
    cout << "VideoPlayer: Video thread started." << endl;

    AVFrame* frame = av_frame_alloc();
    if (!frame) {
        recordError("Video thread: Could not allocate frame.");
        markStopped();
        --m_runningLoops;
        return -1;
    }

    VideoFrameConverter converter;
    const double tb = av_q2d(m_videoTimeBase);
    SteadyClock::time_point deadline = SteadyClock::now();
    bool self_paced = false;    // 上一帧是否由本线程计时

    while (!m_stopped) {
        // 1. 暂停闸门
        if (parkIfPaused()) {
            deadline = SteadyClock::now();
        }
        if (m_stopped) break;

        const int serial = m_seek_serial;
        int ret = m_videoSource->readFrame(frame);
        if (ret == AVERROR_EOF) {
            const int count = ++m_videoLoopCount;
            if (shouldContinueLoop(count)) {
                cout << "VideoPlayer VideoThread: Pass " << count << " finished, looping." << endl;
                if (!m_videoSource->seek(0.0)) {
                    recordError("Video thread: Could not rewind the video stream.");
                    markStopped();
                    break;
                }
                continue;
            }
            cout << "VideoPlayer: Video ended." << endl;
            markStopped();
            break;
        }
        if (ret < 0) {
            recordError("Video thread: Decoding failed: " + errorString(ret));
            markStopped();
            break;
        }

        const double pts = frame->pts * tb;
        const int64_t index = llround(pts * m_fps);

        // 2. Seek 之后，只解码不显示目标之前的帧
        const double skip_until = m_videoSkipUntil;
        if (skip_until >= 0.0) {
            if (pts < skip_until - m_frameDuration / 2) {
                m_stats.frames_skipped++;
                av_frame_unref(frame);
                continue;
            }
            m_videoSkipUntil = -1.0;
        }

        // 3. 时间控制
        bool discard = false;
        if (m_audioActive) {
            // 音频为主时钟：超前则等待，落后太多则丢帧
            self_paced = false;
            SteadyClock::time_point hold_start = SteadyClock::now();
            while (true) {
                if (m_stopped) {
                    discard = true;
                    break;
                }
                const double speed = m_speed;
                const double delay = (pts - m_clock.seconds()) / speed;
                m_stats.av_diff_ms = delay * 1000.0;

                if (delay < -m_config.dropThreshold) {
                    m_stats.frames_dropped++;
                    discard = true;
                    break;
                }
                if (delay <= m_config.syncThreshold || !m_audioActive) {
                    break;
                }
                // 单帧最多等待一个帧间隔，防止时钟停滞时画面冻结
                if (secondsSince(hold_start) >= m_frameDuration / speed) {
                    break;
                }
                if (!m_gate.isSet()) {
                    // 带着这一帧停靠；Seek 之后它已经过时
                    m_gate.wait();
                    if (m_stopped || serial != m_seek_serial) {
                        discard = true;
                        break;
                    }
                    hold_start = SteadyClock::now();
                    continue;
                }
                sleepFor(std::min(delay, m_config.syncThreshold));
            }
        }
        else {
            // 没有音频参考：按帧率自己计时
            if (!self_paced) {
                deadline = SteadyClock::now();
                self_paced = true;
            }
            while (true) {
                if (m_stopped) {
                    discard = true;
                    break;
                }
                if (!m_gate.isSet()) {
                    m_gate.wait();
                    deadline = SteadyClock::now();
                    if (m_stopped || serial != m_seek_serial) {
                        discard = true;
                        break;
                    }
                    continue;
                }
                const double remaining = std::chrono::duration<double>(deadline - SteadyClock::now()).count();
                if (remaining <= 0.0) {
                    break;
                }
                sleepFor(std::min(remaining, SELF_PACE_SLICE));
            }
        }
        if (discard) {
            av_frame_unref(frame);
            continue;
        }

        // 4. 转换并发布
        SurfacePtr surface = converter.toSurface(frame);
        av_frame_unref(frame);
        if (!surface) {
            recordError("Video thread: Could not convert the decoded frame.");
            markStopped();
            break;
        }
        if (!m_audioActive) {
            m_clock.update(pts, index);
        }
        publishFrame(std::move(surface), index, pts);

        if (self_paced) {
            const double interval = m_frameDuration / m_speed;
            deadline += std::chrono::duration_cast<SteadyClock::duration>(std::chrono::duration<double>(interval));
            // 解码跟不上时不追帧，从当前时刻重新计时
            const SteadyClock::time_point now = SteadyClock::now();
            if (deadline + std::chrono::duration_cast<SteadyClock::duration>(std::chrono::duration<double>(m_frameDuration)) < now) {
                deadline = now;
            }
        }
    }

    av_frame_free(&frame);
    --m_runningLoops;
    cout << "VideoPlayer: Video thread finished." << endl;
    return 0;
}

// --- 音频线程 ---

int VideoPlayer::audio_thread_entry(void* opaque) {
    return static_cast<VideoPlayer*>(opaque)->audio_loop_func();
}

int VideoPlayer::audio_loop_func() {
    cout << "VideoPlayer: Audio thread started." << endl;

    AVFrame* frame = av_frame_alloc();
    if (!frame) {
        recordError("Audio thread: Could not allocate frame.");
        markStopped();
        m_audioActive = false;
        --m_runningLoops;
        return -1;
    }

    AudioResampler resampler;
    resampler.setOutput(m_config.frequency, m_audioChannels);
    vector<float> samples;
    const double tb = av_q2d(m_audioTimeBase);
    bool audio_exhausted = false;   // 循环次数已用完，之后的 EOF 不再计数

    while (!m_stopped) {
        parkIfPaused();
        if (m_stopped) break;

        const int serial = m_seek_serial;
        int ret = m_audioSource->readFrame(frame);
        if (ret == AVERROR_EOF) {
            if (!audio_exhausted) {
                const int count = ++m_audioLoopCount;
                if (shouldContinueLoop(count)) {
                    cout << "VideoPlayer AudioThread: Pass " << count << " finished, looping." << endl;
                    if (!m_audioSource->seek(0.0)) {
                        cerr << "VideoPlayer AudioThread: Could not rewind the audio stream." << endl;
                        break;
                    }
                    continue;
                }
                audio_exhausted = true;
                // 音频先结束不会终止会话，视频线程接管计时
                cout << "VideoPlayer: Audio ended." << endl;
            }
            if (!waitForSeekAfterAudioEnd(serial)) break;
            continue;
        }
        if (ret < 0) {
            recordError("Audio thread: Decoding failed: " + errorString(ret));
            markStopped();
            break;
        }

        const double pts = frame->pts * tb;
        const int source_rate = frame->sample_rate > 0 ? frame->sample_rate : m_config.frequency;

        const double skip_until = m_audioSkipUntil;
        if (skip_until >= 0.0) {
            const double end = pts + static_cast<double>(frame->nb_samples) / source_rate;
            if (end <= skip_until) {
                av_frame_unref(frame);
                continue;
            }
            m_audioSkipUntil = -1.0;
        }

        // 1. 先推进主时钟，再处理样本
        m_clock.update(pts, llround(pts * source_rate));

        // 2. 重采样为交错 float
        int converted = resampler.convert(frame, samples);
        av_frame_unref(frame);
        if (converted < 0) {
            recordError("Audio thread: Resampling failed: " + errorString(converted));
            markStopped();
            break;
        }
        if (converted == 0) continue;

        // 3. 音量与速度
        AudioMixer::applyVolume(samples, m_volume);
        const double speed = m_speed;
        if (speed != 1.0) {
            samples = AudioMixer::changeSpeed(samples, m_audioChannels, speed);
        }
        const int frames = static_cast<int>(samples.size() / m_audioChannels);
        if (frames == 0) continue;
        if (m_stopped) break;

        // 4. 写入设备；暂停或 Seek 会打断阻塞中的写入
        bool written = false;
        bool device_lost = false;
        while (!m_stopped) {
            if (m_audioOutput->write(samples.data(), frames, m_audioInterrupt)) {
                written = true;
                break;
            }
            if (m_stopped) break;
            if (m_audioInterrupt) {
                m_gate.wait();
                if (serial != m_seek_serial) {
                    break;  // Seek 之前的样本作废
                }
                continue;
            }

            // 设备故障
            if (m_config.tolerateAudioFailure) {
                cerr << "VideoPlayer Warning: Audio output failed, continuing without audio." << endl;
                m_hasAudio = false;
                m_audioOutput->close();
            }
            else {
                recordError("Audio thread: Audio output device failed.");
                markStopped();
            }
            device_lost = true;
            break;
        }
        if (device_lost) break;

        if (written) {
            m_stats.audio_buffers++;
            m_stats.audio_samples += frames;
        }
    }

    // 从此刻起视频线程自己计时
    m_audioActive = false;
    av_frame_free(&frame);
    --m_runningLoops;
    cout << "VideoPlayer: Audio thread finished." << endl;
    return 0;
}
