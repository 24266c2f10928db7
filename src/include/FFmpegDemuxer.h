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

#include "IFrameSource.h"	// MediaBuffer
#include <string>

//包含用于实现的实际FFmpeg头文件
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>	// AVCodecParameters, AVMediaType
#include <libavutil/time.h>		// AV_TIME_BASE
}

/**
 * @class FFmpegDemuxer
 * @brief 对 AVFormatContext 的简单封装：打开容器、查找流、读包、定位。
 *
 * 除了文件与 URL，也可以通过自定义 AVIOContext 从内存缓冲读取。
 * 每个解码游标持有自己的 FFmpegDemuxer，不在线程之间共享。
 */
class FFmpegDemuxer {
private:
	AVFormatContext* pFormatCtx = nullptr;
	std::string m_url;
	int m_videoStreamIndex = -1;
	int m_audioStreamIndex = -1;

	// 内存数据源相关
	struct MemoryReader {
		MediaBuffer buffer;
		int64_t position = 0;
	};
	AVIOContext* m_ioCtx = nullptr;
	MemoryReader m_reader;

public:
	FFmpegDemuxer();
	~FFmpegDemuxer();

	bool open(const char* url);

	/**
	* @brief 从内存中的媒体数据打开容器。buffer 在 close() 之前保持引用。
	*/
	bool openMemory(MediaBuffer buffer);

	void close();
	bool isOpen() const { return pFormatCtx != nullptr; }

	int readPacket(AVPacket* packet);

	/**
	* @brief 将 streamIndex 所在流定位到 seconds 处或之前最近的关键帧。
	* @param seconds 相对于容器起始时间的秒数
	*/
	bool seek(int streamIndex, double seconds);

	AVFormatContext* getFormatContext() const;
	int findStream(AVMediaType type) const;
	AVStream* getStream(int streamIndex) const;
	AVCodecParameters* getCodecParameters(int streamIndex) const;
	AVRational getTimeBase(int streamIndex) const;

	// 媒体总时长（秒），未知时返回 0
	double getDuration() const;

	// 容器起始时间（秒），未知时返回 0
	double getStartTime() const;

	//禁止复制构造函数和赋值操作符重载
	FFmpegDemuxer(const FFmpegDemuxer&) = delete;
	FFmpegDemuxer& operator=(const FFmpegDemuxer&) = delete;

private:
	// 打开 pFormatCtx（已分配）并检索流信息，open/openMemory 共用
	bool openInternal(const char* url);

	//辅助函数，用于在打开文件后查找流
	void findStreamsInternal();

	static int readMemory(void* opaque, uint8_t* buf, int buf_size);
	static int64_t seekMemory(void* opaque, int64_t offset, int whence);
};
