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

#include "PlayerConfig.h"

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
}

/**
 * @class IMediaEncoder
 * @brief 编码并封装到输出容器的接口。
 *
 * 视频与音频的编码可以在两个线程中并发调用（各自只访问自己的编码器），
 * 写入容器的操作由实现内部串行化。
 */
class IMediaEncoder {
public:
	virtual ~IMediaEncoder() = default;

	/**
	 * @brief 创建输出容器，添加视频流（以及可选的音频流），写入文件头。
	 */
	virtual bool open(const RecorderConfig& config) = 0;

	/**
	 * @brief 视频编码器期望的输入像素格式。
	 */
	virtual AVPixelFormat videoPixelFormat() const = 0;

	/**
	 * @brief 音频编码器每帧需要的样本数。
	 */
	virtual int audioFrameSize() const = 0;

	/**
	 * @brief 编码一帧视频并写入产生的所有数据包。frame->pts 以 1/frameRate 为单位。
	 * @return 0 成功，负值为 FFmpeg 错误码
	 */
	virtual int encodeVideo(AVFrame* frame) = 0;

	/**
	 * @brief 编码一帧 fltp 音频并写入产生的所有数据包。frame->pts 以 1/frequency 为单位。
	 */
	virtual int encodeAudio(AVFrame* frame) = 0;

	/**
	 * @brief 以空输入冲洗两个编码器，写出其缓存的全部数据包。
	 */
	virtual int flush() = 0;

	/**
	 * @brief 写入文件尾并释放资源。可重复调用。
	 */
	virtual void close() = 0;
};
