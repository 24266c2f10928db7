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

#include "../include/FFmpegDecoder.h"
#include <iostream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>		// av_make_error_string
}

using namespace std;

FFmpegDecoder::FFmpegDecoder() {}

FFmpegDecoder::~FFmpegDecoder() {
	close();
}

bool FFmpegDecoder::init(AVCodecParameters* codecParams, AVRational timeBase) {
	if (!codecParams) {
		cerr << "FFmpegDecoder::init Error: codecParams is null." << endl;
		return false;
	}

	// 如果已经初始化，先关闭旧的上下文
	if (m_codecContext) {
		close();
	}

	//1、查找解码器
	const AVCodec* codec = avcodec_find_decoder(codecParams->codec_id);
	if (!codec) {
		cerr << "FFmpegDecoder::init Error: Decoder not found for codec ID " << codecParams->codec_id
			<< " (" << avcodec_get_name(codecParams->codec_id) << ")." << endl;
		return false;
	}

	//2、分配解码器上下文
	m_codecContext = avcodec_alloc_context3(codec);
	if (!m_codecContext) {
		cerr << "FFmpegDecoder::init Error: Failed to allocate AVCodecContext." << endl;
		return false;
	}

	// 3、拷贝编解码器参数到上下文
	if (avcodec_parameters_to_context(m_codecContext, codecParams) < 0) {
		cerr << "FFmpegDecoder::init Error: Could not copy codec parameters to context." << endl;
		avcodec_free_context(&m_codecContext);
		return false;
	}

	// 手动设置时间基，解码器按此时间基输出 pts
	m_codecContext->pkt_timebase = timeBase;
	m_codecContext->time_base = timeBase;

	// 4、打开解码器
	if (avcodec_open2(m_codecContext, codec, nullptr) < 0) {
		cerr << "FFmpegDecoder::init Error: Could not open codec (" << codec->long_name << ")" << endl;
		avcodec_free_context(&m_codecContext);
		return false;
	}

	cout << "FFmpegDecoder initialized with codec: " << codec->long_name
		<< ", TimeBase: " << timeBase.num << "/" << timeBase.den << endl;
	return true;
}

int FFmpegDecoder::sendPacket(const AVPacket* packet) {
	if (!m_codecContext) {
		cerr << "FFmpegDecoder::sendPacket Error: Decoder not initialized or has been closed." << endl;
		return AVERROR(EINVAL); // 无效参数或状态
	}

	int ret = avcodec_send_packet(m_codecContext, packet);
	if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
		// 发生了一个不可恢复的发送错误
		char errbuf[AV_ERROR_MAX_STRING_SIZE];
		av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, ret);
		cerr << "FFmpegDecoder::sendPacket Error: Failed to send packet to decoder: " << errbuf << endl;
	}
	return ret;
}

int FFmpegDecoder::receiveFrame(AVFrame* frame) {
	if (!m_codecContext || !frame) {
		return AVERROR(EINVAL);
	}

	// avcodec 内部自动完成 PTS 和 DTS 的顺序协调
	int ret = avcodec_receive_frame(m_codecContext, frame);
	if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
		char errbuf[AV_ERROR_MAX_STRING_SIZE];
		av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, ret);
		cerr << "FFmpegDecoder::receiveFrame Error: Failed to receive frame from decoder: " << errbuf << endl;
	}
	return ret;
}

void FFmpegDecoder::flush() {
	if (m_codecContext) {
		avcodec_flush_buffers(m_codecContext);
	}
}

void FFmpegDecoder::close() {
	if (m_codecContext) {
		avcodec_free_context(&m_codecContext);	// 释放上下文内存，m_codecContext 会被置为 nullptr
	}
}

int FFmpegDecoder::getWidth() const {
	return m_codecContext ? m_codecContext->width : 0;
}

int FFmpegDecoder::getHeight() const {
	return m_codecContext ? m_codecContext->height : 0;
}

AVPixelFormat FFmpegDecoder::getPixelFormat() const {
	return m_codecContext ? m_codecContext->pix_fmt : AV_PIX_FMT_NONE;
}

int FFmpegDecoder::getSampleRate() const {
	return m_codecContext ? m_codecContext->sample_rate : 0;
}

int FFmpegDecoder::getChannels() const {
	return m_codecContext ? m_codecContext->ch_layout.nb_channels : 0;
}

AVSampleFormat FFmpegDecoder::getSampleFormat() const {
	return m_codecContext ? m_codecContext->sample_fmt : AV_SAMPLE_FMT_NONE;
}

AVRational FFmpegDecoder::getTimeBase() const {
	if (m_codecContext) {
		return m_codecContext->pkt_timebase;
	}
	return { 0,1 };	// 返回一个表示无效或未初始化的时间基准
}
