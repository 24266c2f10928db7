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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/rational.h>
}

// 一条音轨或视频轨的基本信息
struct StreamInfo {
	bool hasStream = false;
	double duration = 0.0;			// 秒，未知时为 0
	AVRational frameRate{ 0, 1 };	// 视频平均帧率
	AVRational timeBase{ 0, 1 };	// pts 的单位
	int width = 0;
	int height = 0;
	int sampleRate = 0;
	int channels = 0;
};

// 多个解码游标共享的只读字节缓冲
using MediaBuffer = std::shared_ptr<const std::vector<uint8_t>>;

/**
 * @class IFrameSource
 * @brief 单条轨道上的解码游标：按解码顺序逐帧产出已解码的 AVFrame。
 *
 * 播放器为视频轨和音轨各打开一个独立的游标，两个解码线程互不共享解复用器。
 * 一个游标同一时刻只被一个线程使用。
 */
class IFrameSource {
public:
	virtual ~IFrameSource() = default;

	/**
	 * @brief 打开本地文件或 URL 上的对应轨道。
	 * @return 无法打开或不存在该类型的轨道时返回 false
	 */
	virtual bool open(const std::string& url) = 0;

	/**
	 * @brief 从内存中的媒体数据打开对应轨道。
	 */
	virtual bool openMemory(MediaBuffer buffer) = 0;

	virtual StreamInfo info() const = 0;

	/**
	 * @brief 读取下一帧已解码的数据。
	 * @param frame 调用者分配的 AVFrame，本函数会先 unref 再写入；
	 *        frame->pts 总是有效（以 timeBase() 为单位）。
	 * @return 0 成功；AVERROR_EOF 本轮数据已读完；其它负值表示解码错误
	 */
	virtual int readFrame(AVFrame* frame) = 0;

	/**
	 * @brief 定位到 seconds 处或之前最近的关键帧，并清空解码器缓存。
	 */
	virtual bool seek(double seconds) = 0;

	virtual AVRational timeBase() const = 0;

	/**
	 * @brief 释放所有资源；可重复调用。
	 */
	virtual void close() = 0;
};
