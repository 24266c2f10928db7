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

#include "IMediaEncoder.h"
#include <mutex>
#include <string>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

/**
 * @class FFmpegMediaEncoder
 * @brief 使用 libavcodec 编码、libavformat 封装的输出文件。
 *
 * 容器格式由输出文件扩展名推断。
 */
class FFmpegMediaEncoder : public IMediaEncoder {
public:
	FFmpegMediaEncoder() = default;
	~FFmpegMediaEncoder() override;

	FFmpegMediaEncoder(const FFmpegMediaEncoder&) = delete;
	FFmpegMediaEncoder& operator=(const FFmpegMediaEncoder&) = delete;

	bool open(const RecorderConfig& config) override;
	AVPixelFormat videoPixelFormat() const override;
	int audioFrameSize() const override;
	int encodeVideo(AVFrame* frame) override;
	int encodeAudio(AVFrame* frame) override;
	int flush() override;
	void close() override;

private:
	bool openVideoStream(const RecorderConfig& config);
	bool openAudioStream(const RecorderConfig& config);

	/**
	 * @brief 送入一帧（nullptr 表示冲洗），取出并写入全部数据包。
	 */
	int encodeAndMux(AVCodecContext* codecCtx, AVStream* stream, AVFrame* frame);

	AVFormatContext* m_formatCtx = nullptr;
	AVCodecContext* m_videoCtx = nullptr;
	AVCodecContext* m_audioCtx = nullptr;
	AVStream* m_videoStream = nullptr;
	AVStream* m_audioStream = nullptr;

	std::mutex m_muxMutex;		// 视频与音频线程共享同一个容器
	bool m_headerWritten = false;
	bool m_flushed = false;
	std::string m_outputFile;
};
