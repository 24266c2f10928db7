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

extern "C" {
#include <libavcodec/codec_par.h>
#include <libavcodec/packet.h>
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
#include <libavutil/samplefmt.h>
}

// 前向声明 FFmpeg 类型，避免在头文件中包含庞大的FFmpeg头文件
struct AVCodecContext;

/**
 * @class FFmpegDecoder
 * @brief 音频或视频解码器（send/receive 模型）。
 *
 * 一个数据包可能解出零个或多个帧（音频尤其常见），因此发送与接收分开调用：
 * 调用者先 receiveFrame() 直到返回 AVERROR(EAGAIN)，再 sendPacket() 送入下一个包。
 */
class FFmpegDecoder {
public:
	FFmpegDecoder();
	~FFmpegDecoder();

	//禁止拷贝构造函数和赋值操作符
	FFmpegDecoder(const FFmpegDecoder&) = delete;
	FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

	/**
	* @brief 使用给定的编解码器参数初始化解码器。
	* @param codecParams 从解复用器获取的 AVCodecParameters。
	* @param timeBase 所属流的时间基。
	* @return 若初始化成功返回 true，否则返回 false（例如不支持的编解码器）。
	*/
	bool init(AVCodecParameters* codecParams, AVRational timeBase);

	/**
	* @brief 送入一个压缩数据包；packet 为 nullptr 表示冲洗解码器。
	* @return 0 成功，AVERROR(EAGAIN) 需先取走已解码帧，AVERROR_EOF 已冲洗，其它负值为错误
	*/
	int sendPacket(const AVPacket* packet);

	/**
	* @brief 取出一帧已解码数据到调用者提供的 frame 中。
	* @return 0 成功，AVERROR(EAGAIN) 需要更多输入，AVERROR_EOF 已全部取出，其它负值为错误
	*/
	int receiveFrame(AVFrame* frame);

	/**
	* @brief 清空解码器内部缓存（Seek 之后调用），同时解除冲洗状态。
	*/
	void flush();

	/**
	* @brief 关闭解码器并释放所有相关 FFmpeg 资源。
	*/
	void close();

	bool isOpen() const { return m_codecContext != nullptr; }

	int getWidth() const;
	int getHeight() const;
	AVPixelFormat getPixelFormat() const;
	int getSampleRate() const;
	int getChannels() const;
	AVSampleFormat getSampleFormat() const;
	AVRational getTimeBase() const;

private:
	AVCodecContext* m_codecContext = nullptr;	// FFmpeg 解码器上下文
};
