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

#include "IFrameSource.h"
#include "FFmpegDemuxer.h"
#include "FFmpegDecoder.h"

/**
 * @class FFmpegFrameSource
 * @brief 基于 FFmpegDemuxer + FFmpegDecoder 的单轨解码游标。
 *
 * 构造时指定轨道类型（视频或音频）。输出帧的 pts 以流时间基为单位，
 * 并已减去容器起始时间，即从 0 开始计时。
 */
class FFmpegFrameSource : public IFrameSource {
public:
	explicit FFmpegFrameSource(AVMediaType type);
	~FFmpegFrameSource() override;

	FFmpegFrameSource(const FFmpegFrameSource&) = delete;
	FFmpegFrameSource& operator=(const FFmpegFrameSource&) = delete;

	bool open(const std::string& url) override;
	bool openMemory(MediaBuffer buffer) override;
	StreamInfo info() const override;
	int readFrame(AVFrame* frame) override;
	bool seek(double seconds) override;
	AVRational timeBase() const override;
	void close() override;

	AVMediaType mediaType() const { return m_type; }

private:
	// 容器已打开后，定位轨道并初始化解码器
	bool setupStream();

	AVMediaType m_type;
	FFmpegDemuxer m_demuxer;
	FFmpegDecoder m_decoder;
	AVPacket* m_packet = nullptr;

	int m_streamIndex = -1;
	StreamInfo m_info;
	int64_t m_startOffset = 0;				// 容器起始时间（流时间基）
	int64_t m_nextPts = AV_NOPTS_VALUE;		// 缺失 pts 时的推算值
	bool m_draining = false;				// 已向解码器发送冲洗信号
};
