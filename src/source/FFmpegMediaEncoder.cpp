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

#include "../include/FFmpegMediaEncoder.h"
#include <iostream>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/pixdesc.h>
}

using namespace std;

namespace {
	string errorString(int errnum) {
		char errbuf[AV_ERROR_MAX_STRING_SIZE];
		av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, errnum);
		return string(errbuf);
	}
}

FFmpegMediaEncoder::~FFmpegMediaEncoder() {
	close();
}

bool FFmpegMediaEncoder::open(const RecorderConfig& config) {
	close();

	if (config.width <= 0 || config.height <= 0 || config.frameRate <= 0) {
		cerr << "FFmpegMediaEncoder Error: Invalid video parameters " << config.width << "x" << config.height
			<< " @ " << config.frameRate << " fps" << endl;
		return false;
	}

	// 1. 输出容器，格式由文件扩展名推断
	int ret = avformat_alloc_output_context2(&m_formatCtx, nullptr, nullptr, config.outputFile.c_str());
	if (ret < 0 || !m_formatCtx) {
		cerr << "FFmpegMediaEncoder Error: Could not create output context for " << config.outputFile
			<< " (" << errorString(ret) << ")" << endl;
		m_formatCtx = nullptr;
		return false;
	}
	m_outputFile = config.outputFile;

	// 2. 视频流（必选）与音频流（可选）
	if (!openVideoStream(config)) {
		close();
		return false;
	}
	if (config.recordAudio && !openAudioStream(config)) {
		close();
		return false;
	}

	// 3. 打开文件并写入文件头
	if (!(m_formatCtx->oformat->flags & AVFMT_NOFILE)) {
		ret = avio_open(&m_formatCtx->pb, config.outputFile.c_str(), AVIO_FLAG_WRITE);
		if (ret < 0) {
			cerr << "FFmpegMediaEncoder Error: Could not open " << config.outputFile << " (" << errorString(ret) << ")" << endl;
			close();
			return false;
		}
	}

	ret = avformat_write_header(m_formatCtx, nullptr);
	if (ret < 0) {
		cerr << "FFmpegMediaEncoder Error: Failed to write header (" << errorString(ret) << ")" << endl;
		close();
		return false;
	}
	m_headerWritten = true;
	m_flushed = false;

	cout << "FFmpegMediaEncoder: Recording to " << config.outputFile << " (" << config.width << "x" << config.height
		<< " @ " << config.frameRate << " fps, " << config.videoCodec
		<< (config.recordAudio ? ", audio: " + config.audioCodec : string()) << ")" << endl;
	return true;
}

bool FFmpegMediaEncoder::openVideoStream(const RecorderConfig& config) {
	const AVCodec* codec = avcodec_find_encoder_by_name(config.videoCodec.c_str());
	if (!codec) {
		cerr << "FFmpegMediaEncoder Error: Video encoder not found: " << config.videoCodec << endl;
		return false;
	}

	const AVPixelFormat pix_fmt = av_get_pix_fmt(config.pixelFormat.c_str());
	if (pix_fmt == AV_PIX_FMT_NONE) {
		cerr << "FFmpegMediaEncoder Error: Unknown pixel format: " << config.pixelFormat << endl;
		return false;
	}

	m_videoStream = avformat_new_stream(m_formatCtx, nullptr);
	if (!m_videoStream) {
		cerr << "FFmpegMediaEncoder Error: Failed to create video stream" << endl;
		return false;
	}
	m_videoStream->id = m_formatCtx->nb_streams - 1;

	m_videoCtx = avcodec_alloc_context3(codec);
	if (!m_videoCtx) {
		cerr << "FFmpegMediaEncoder Error: Failed to allocate video codec context" << endl;
		return false;
	}

	m_videoCtx->width = config.width;
	m_videoCtx->height = config.height;
	m_videoCtx->pix_fmt = pix_fmt;
	m_videoCtx->time_base = AVRational{ 1, config.frameRate };
	m_videoCtx->framerate = AVRational{ config.frameRate, 1 };
	m_videoCtx->gop_size = config.frameRate;
	m_videoStream->time_base = m_videoCtx->time_base;

	if (m_formatCtx->oformat->flags & AVFMT_GLOBALHEADER) {
		m_videoCtx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
	}

	int ret = avcodec_open2(m_videoCtx, codec, nullptr);
	if (ret < 0) {
		cerr << "FFmpegMediaEncoder Error: Failed to open video codec " << config.videoCodec
			<< " (" << errorString(ret) << ")" << endl;
		return false;
	}

	// 编码器打开之后再拷贝参数（包括 extradata）
	ret = avcodec_parameters_from_context(m_videoStream->codecpar, m_videoCtx);
	if (ret < 0) {
		cerr << "FFmpegMediaEncoder Error: Failed to copy video codec parameters (" << errorString(ret) << ")" << endl;
		return false;
	}
	return true;
}

bool FFmpegMediaEncoder::openAudioStream(const RecorderConfig& config) {
	const AVCodec* codec = avcodec_find_encoder_by_name(config.audioCodec.c_str());
	if (!codec) {
		cerr << "FFmpegMediaEncoder Error: Audio encoder not found: " << config.audioCodec << endl;
		return false;
	}

	m_audioStream = avformat_new_stream(m_formatCtx, nullptr);
	if (!m_audioStream) {
		cerr << "FFmpegMediaEncoder Error: Failed to create audio stream" << endl;
		return false;
	}
	m_audioStream->id = m_formatCtx->nb_streams - 1;

	m_audioCtx = avcodec_alloc_context3(codec);
	if (!m_audioCtx) {
		cerr << "FFmpegMediaEncoder Error: Failed to allocate audio codec context" << endl;
		return false;
	}

	// 采集数据按 fltp 送入编码器
	m_audioCtx->sample_fmt = AV_SAMPLE_FMT_FLTP;
	m_audioCtx->sample_rate = config.frequency;
	if (av_channel_layout_from_string(&m_audioCtx->ch_layout, config.channelLayout.c_str()) < 0
		|| m_audioCtx->ch_layout.nb_channels != config.channels) {
		av_channel_layout_uninit(&m_audioCtx->ch_layout);
		av_channel_layout_default(&m_audioCtx->ch_layout, config.channels);
	}
	m_audioCtx->bit_rate = 128000;
	m_audioCtx->time_base = AVRational{ 1, config.frequency };
	m_audioStream->time_base = m_audioCtx->time_base;

	if (m_formatCtx->oformat->flags & AVFMT_GLOBALHEADER) {
		m_audioCtx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
	}

	int ret = avcodec_open2(m_audioCtx, codec, nullptr);
	if (ret < 0) {
		cerr << "FFmpegMediaEncoder Error: Failed to open audio codec " << config.audioCodec
			<< " (" << errorString(ret) << ")" << endl;
		return false;
	}

	ret = avcodec_parameters_from_context(m_audioStream->codecpar, m_audioCtx);
	if (ret < 0) {
		cerr << "FFmpegMediaEncoder Error: Failed to copy audio codec parameters (" << errorString(ret) << ")" << endl;
		return false;
	}
	return true;
}

AVPixelFormat FFmpegMediaEncoder::videoPixelFormat() const {
	return m_videoCtx ? m_videoCtx->pix_fmt : AV_PIX_FMT_NONE;
}

int FFmpegMediaEncoder::audioFrameSize() const {
	if (!m_audioCtx) {
		return 0;
	}
	// 可变帧长的编码器（例如 PCM）报告 0，此时按 1024 采集
	return m_audioCtx->frame_size > 0 ? m_audioCtx->frame_size : 1024;
}

int FFmpegMediaEncoder::encodeVideo(AVFrame* frame) {
	if (!m_videoCtx || !m_headerWritten) {
		return AVERROR(EINVAL);
	}
	return encodeAndMux(m_videoCtx, m_videoStream, frame);
}

int FFmpegMediaEncoder::encodeAudio(AVFrame* frame) {
	if (!m_audioCtx || !m_headerWritten) {
		return AVERROR(EINVAL);
	}
	return encodeAndMux(m_audioCtx, m_audioStream, frame);
}

int FFmpegMediaEncoder::encodeAndMux(AVCodecContext* codecCtx, AVStream* stream, AVFrame* frame) {
	int ret = avcodec_send_frame(codecCtx, frame);
	if (ret < 0) {
		if (ret == AVERROR_EOF && !frame) {
			return 0; // 已经冲洗过
		}
		cerr << "FFmpegMediaEncoder Error: avcodec_send_frame failed (" << errorString(ret) << ")" << endl;
		return ret;
	}

	AVPacket* packet = av_packet_alloc();
	if (!packet) {
		return AVERROR(ENOMEM);
	}

	while (true) {
		ret = avcodec_receive_packet(codecCtx, packet);
		if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
			ret = 0;
			break;
		}
		if (ret < 0) {
			cerr << "FFmpegMediaEncoder Error: avcodec_receive_packet failed (" << errorString(ret) << ")" << endl;
			break;
		}

		av_packet_rescale_ts(packet, codecCtx->time_base, stream->time_base);
		packet->stream_index = stream->index;

		// av_interleaved_write_frame 接管数据包的引用
		std::lock_guard<std::mutex> lock(m_muxMutex);
		ret = av_interleaved_write_frame(m_formatCtx, packet);
		if (ret < 0) {
			cerr << "FFmpegMediaEncoder Error: av_interleaved_write_frame failed (" << errorString(ret) << ")" << endl;
			break;
		}
	}

	av_packet_free(&packet);
	return ret;
}

int FFmpegMediaEncoder::flush() {
	if (!m_headerWritten || m_flushed) {
		return 0;
	}
	m_flushed = true;

	int ret = 0;
	if (m_videoCtx) {
		ret = encodeAndMux(m_videoCtx, m_videoStream, nullptr);
	}
	if (m_audioCtx) {
		int audio_ret = encodeAndMux(m_audioCtx, m_audioStream, nullptr);
		if (ret == 0) {
			ret = audio_ret;
		}
	}
	return ret;
}

void FFmpegMediaEncoder::close() {
	if (m_formatCtx && m_headerWritten) {
		int ret = av_write_trailer(m_formatCtx);
		if (ret < 0) {
			cerr << "FFmpegMediaEncoder Error: av_write_trailer failed (" << errorString(ret) << ")" << endl;
		}
		cout << "FFmpegMediaEncoder: Closed " << m_outputFile << endl;
	}
	m_headerWritten = false;

	if (m_videoCtx) {
		avcodec_free_context(&m_videoCtx);
	}
	if (m_audioCtx) {
		avcodec_free_context(&m_audioCtx);
	}
	if (m_formatCtx) {
		if (m_formatCtx->pb && !(m_formatCtx->oformat->flags & AVFMT_NOFILE)) {
			avio_closep(&m_formatCtx->pb);
		}
		avformat_free_context(m_formatCtx);
		m_formatCtx = nullptr;
	}
	m_videoStream = nullptr;
	m_audioStream = nullptr;
}
