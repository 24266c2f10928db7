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

#include "../include/FFmpegFrameSource.h"
#include <iostream>

extern "C" {
#include <libavutil/error.h>
}

using namespace std;

FFmpegFrameSource::FFmpegFrameSource(AVMediaType type) : m_type(type) {}

FFmpegFrameSource::~FFmpegFrameSource() {
	close();
}

bool FFmpegFrameSource::open(const std::string& url) {
	close();
	if (!m_demuxer.open(url.c_str())) {
		return false;
	}
	return setupStream();
}

bool FFmpegFrameSource::openMemory(MediaBuffer buffer) {
	close();
	if (!m_demuxer.openMemory(buffer)) {
		return false;
	}
	return setupStream();
}

bool FFmpegFrameSource::setupStream() {
	const char* type_name = av_get_media_type_string(m_type);
	if (!type_name) {
		type_name = "unknown";
	}

	m_streamIndex = m_demuxer.findStream(m_type);
	if (m_streamIndex < 0) {
		cout << "FFmpegFrameSource: No " << type_name << " stream found." << endl;
		close();
		return false;
	}

	AVStream* stream = m_demuxer.getStream(m_streamIndex);
	if (!m_decoder.init(stream->codecpar, stream->time_base)) {
		cerr << "FFmpegFrameSource Error: Unsupported " << type_name << " codec." << endl;
		close();
		return false;
	}

	m_packet = av_packet_alloc();
	if (!m_packet) {
		cerr << "FFmpegFrameSource Error: av_packet_alloc failed." << endl;
		close();
		return false;
	}

	// 1. 轨道信息
	m_info = StreamInfo();
	m_info.hasStream = true;
	m_info.timeBase = stream->time_base;
	m_info.duration = m_demuxer.getDuration();

	if (m_type == AVMEDIA_TYPE_VIDEO) {
		AVRational rate = stream->avg_frame_rate;
		if (rate.num <= 0 || rate.den <= 0) {
			rate = av_guess_frame_rate(m_demuxer.getFormatContext(), stream, nullptr);
		}
		if (rate.num <= 0 || rate.den <= 0) {
			cout << "FFmpegFrameSource: Frame rate unknown, assuming 25 fps." << endl;
			rate = { 25, 1 };
		}
		m_info.frameRate = rate;
		m_info.width = stream->codecpar->width;
		m_info.height = stream->codecpar->height;
	}
	else {
		m_info.sampleRate = stream->codecpar->sample_rate;
		m_info.channels = stream->codecpar->ch_layout.nb_channels;
	}

	// 2. 所有输出 pts 都相对于容器起始时间
	if (m_demuxer.getFormatContext()->start_time != AV_NOPTS_VALUE) {
		m_startOffset = av_rescale_q(m_demuxer.getFormatContext()->start_time, AV_TIME_BASE_Q, stream->time_base);
	}
	m_nextPts = AV_NOPTS_VALUE;
	m_draining = false;
	return true;
}

StreamInfo FFmpegFrameSource::info() const {
	return m_info;
}

int FFmpegFrameSource::readFrame(AVFrame* frame) {
	if (!frame || m_streamIndex < 0 || !m_packet) {
		return AVERROR(EINVAL);
	}
	av_frame_unref(frame);

	while (true) {
		// 1. 先取走解码器中已有的帧
		int ret = m_decoder.receiveFrame(frame);
		if (ret == 0) {
			break;
		}
		if (ret == AVERROR_EOF) {
			return AVERROR_EOF;
		}
		if (ret != AVERROR(EAGAIN)) {
			return ret;
		}
		if (m_draining) {
			// 冲洗后不应再返回 EAGAIN，按流结束处理
			return AVERROR_EOF;
		}

		// 2. 读取本轨道的下一个数据包
		ret = m_demuxer.readPacket(m_packet);
		if (ret == AVERROR_EOF) {
			m_decoder.sendPacket(nullptr); // 冲洗解码器，取出剩余的缓存帧
			m_draining = true;
			continue;
		}
		if (ret < 0) {
			char errbuf[AV_ERROR_MAX_STRING_SIZE];
			av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, ret);
			cerr << "FFmpegFrameSource Error: Failed to read packet: " << errbuf << endl;
			return ret;
		}
		if (m_packet->stream_index != m_streamIndex) {
			av_packet_unref(m_packet);
			continue;
		}

		ret = m_decoder.sendPacket(m_packet);
		av_packet_unref(m_packet);
		if (ret < 0 && ret != AVERROR(EAGAIN)) {
			return ret;
		}
	}

	// 3. 统一 pts：缺失时使用 best_effort，再不行按上一帧推算
	if (frame->pts == AV_NOPTS_VALUE) {
		frame->pts = frame->best_effort_timestamp;
	}
	if (frame->pts == AV_NOPTS_VALUE) {
		frame->pts = (m_nextPts != AV_NOPTS_VALUE) ? m_nextPts : m_startOffset;
	}
	frame->pts -= m_startOffset;
	if (frame->pts < 0) {
		frame->pts = 0;
	}

	if (m_type == AVMEDIA_TYPE_AUDIO && frame->sample_rate > 0) {
		m_nextPts = frame->pts + m_startOffset
			+ av_rescale_q(frame->nb_samples, AVRational{ 1, frame->sample_rate }, m_info.timeBase);
	}
	else if (m_info.frameRate.num > 0) {
		m_nextPts = frame->pts + m_startOffset
			+ av_rescale_q(1, av_inv_q(m_info.frameRate), m_info.timeBase);
	}
	return 0;
}

bool FFmpegFrameSource::seek(double seconds) {
	if (m_streamIndex < 0) {
		return false;
	}
	if (seconds < 0.0) {
		seconds = 0.0;
	}
	if (!m_demuxer.seek(m_streamIndex, seconds)) {
		return false;
	}
	m_decoder.flush();
	m_draining = false;
	m_nextPts = AV_NOPTS_VALUE;
	return true;
}

AVRational FFmpegFrameSource::timeBase() const {
	return m_info.timeBase;
}

void FFmpegFrameSource::close() {
	if (m_packet) {
		av_packet_free(&m_packet);
	}
	m_decoder.close();
	m_demuxer.close();
	m_streamIndex = -1;
	m_startOffset = 0;
	m_draining = false;
	m_info = StreamInfo();
}
