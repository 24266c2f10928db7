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

#include "../include/FFmpegDemuxer.h"
#include <iostream> // 用于错误信息
#include <cstring>
#include <cstdio>	// SEEK_SET

extern "C" {
#include <libavutil/mem.h>
#include <libavutil/error.h>
}

using namespace std;

namespace {
	const int MEMORY_IO_BUFFER_SIZE = 32 * 1024;

	string errorString(int errnum) {
		char errbuf[AV_ERROR_MAX_STRING_SIZE];
		av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, errnum);
		return string(errbuf);
	}
}

FFmpegDemuxer::FFmpegDemuxer() {
	// FFmpeg的全局初始化（avformat_network_init()）由宿主程序完成一次
}

FFmpegDemuxer::~FFmpegDemuxer() {
	//析构函数确保调用了 close()
	close();
}

bool FFmpegDemuxer::open(const char* url) {
	//先确保关闭先前的上下文
	close();

	pFormatCtx = avformat_alloc_context();
	if (!pFormatCtx) {
		cerr << "FFmpegDemuxer Error: Could not allocate format context." << endl;
		return false;
	}
	return openInternal(url);
}

bool FFmpegDemuxer::openMemory(MediaBuffer buffer) {
	close();

	if (!buffer || buffer->empty()) {
		cerr << "FFmpegDemuxer Error: Memory source is empty." << endl;
		return false;
	}

	m_reader.buffer = buffer;
	m_reader.position = 0;

	// AVIOContext 的缓冲区必须由 av_malloc 分配，之后由 FFmpeg 管理（可能被重新分配）
	uint8_t* io_buffer = static_cast<uint8_t*>(av_malloc(MEMORY_IO_BUFFER_SIZE));
	if (!io_buffer) {
		cerr << "FFmpegDemuxer Error: Could not allocate IO buffer." << endl;
		m_reader.buffer.reset();
		return false;
	}

	m_ioCtx = avio_alloc_context(io_buffer, MEMORY_IO_BUFFER_SIZE, 0, &m_reader,
		&FFmpegDemuxer::readMemory, nullptr, &FFmpegDemuxer::seekMemory);
	if (!m_ioCtx) {
		cerr << "FFmpegDemuxer Error: Could not allocate AVIOContext." << endl;
		av_free(io_buffer);
		m_reader.buffer.reset();
		return false;
	}

	pFormatCtx = avformat_alloc_context();
	if (!pFormatCtx) {
		cerr << "FFmpegDemuxer Error: Could not allocate format context." << endl;
		close();
		return false;
	}
	pFormatCtx->pb = m_ioCtx;	// 自定义IO，avformat_close_input 不会释放它

	return openInternal("memory");
}

bool FFmpegDemuxer::openInternal(const char* url) {
	//打开输入；失败时 avformat_open_input 会释放 pFormatCtx 并置空
	int ret = avformat_open_input(&pFormatCtx, url, nullptr, nullptr);
	if (ret != 0) {
		cerr << "FFmpegDemuxer Error: Couldn't open input stream: " << url << " (" << errorString(ret) << ")" << endl;
		pFormatCtx = nullptr;
		close();
		return false;
	}

	//检索流信息
	ret = avformat_find_stream_info(pFormatCtx, nullptr);
	if (ret < 0) {
		cerr << "FFmpegDemuxer Error: Couldn't find stream information (" << errorString(ret) << ")" << endl;
		close();
		return false;
	}

	//存储 URL统一资源定位器 、寻找音视频流
	m_url = url;
	findStreamsInternal();//查找并缓存流索引

	cout << "FFmpegDemuxer: Opened " << url << " successfully." << endl;
	if (m_videoStreamIndex >= 0) {
		cout << " Video stream index: " << m_videoStreamIndex << endl;
	}
	if (m_audioStreamIndex >= 0) {
		cout << " Audio stream index: " << m_audioStreamIndex << endl;
	}

	return true;
}

void FFmpegDemuxer::close() {
	if (pFormatCtx) {
		avformat_close_input(&pFormatCtx);
		// pFormatCtx 通过 avformat_close_input() 被设为空
		pFormatCtx = nullptr;
		m_videoStreamIndex = -1;
		m_audioStreamIndex = -1;
		m_url.clear();
	}
	if (m_ioCtx) {
		av_freep(&m_ioCtx->buffer);
		avio_context_free(&m_ioCtx);
	}
	m_reader.buffer.reset();
	m_reader.position = 0;
}

int FFmpegDemuxer::readPacket(AVPacket* packet) {
	if (!pFormatCtx) {
		return AVERROR(EINVAL);//无效状态，没有打开
	}
	return av_read_frame(pFormatCtx, packet);//读取下一个 frame/packet
}

bool FFmpegDemuxer::seek(int streamIndex, double seconds) {
	AVStream* stream = getStream(streamIndex);
	if (!stream) {
		return false;
	}

	// 秒 -> 流时间基，加上容器的起始时间偏移
	int64_t target = av_rescale_q(static_cast<int64_t>(seconds * AV_TIME_BASE), AV_TIME_BASE_Q, stream->time_base);
	if (pFormatCtx->start_time != AV_NOPTS_VALUE) {
		target += av_rescale_q(pFormatCtx->start_time, AV_TIME_BASE_Q, stream->time_base);
	}

	// AVSEEK_FLAG_BACKWARD: 定位到目标处或之前最近的关键帧
	int ret = av_seek_frame(pFormatCtx, streamIndex, target, AVSEEK_FLAG_BACKWARD);
	if (ret < 0) {
		cerr << "FFmpegDemuxer Error: Seek to " << seconds << "s failed (" << errorString(ret) << ")" << endl;
		return false;
	}
	return true;
}

AVFormatContext* FFmpegDemuxer::getFormatContext() const {
	return pFormatCtx;
}

//查找流的辅助函数，由 openInternal() 调用
void FFmpegDemuxer::findStreamsInternal() {
	if (!pFormatCtx) return;

	m_videoStreamIndex = av_find_best_stream(pFormatCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
	m_audioStreamIndex = av_find_best_stream(pFormatCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);

	// av_find_best_stream 失败时返回负的错误码，统一记为 -1
	if (m_videoStreamIndex < 0) m_videoStreamIndex = -1;
	if (m_audioStreamIndex < 0) m_audioStreamIndex = -1;
}

int FFmpegDemuxer::findStream(AVMediaType type) const {
	//返回缓存索引
	if (type == AVMEDIA_TYPE_VIDEO) {
		return m_videoStreamIndex;
	}
	else if (type == AVMEDIA_TYPE_AUDIO) {
		return m_audioStreamIndex;
	}
	return -1;//没找到类型或者没有缓存
}

AVStream* FFmpegDemuxer::getStream(int streamIndex) const {
	if (!pFormatCtx || streamIndex < 0 || streamIndex >= static_cast<int>(pFormatCtx->nb_streams)) {
		return nullptr;//无效的索引或者上下文
	}
	return pFormatCtx->streams[streamIndex];
}

AVCodecParameters* FFmpegDemuxer::getCodecParameters(int streamIndex)const {
	AVStream* stream = getStream(streamIndex);
	return stream ? stream->codecpar : nullptr;
}

AVRational FFmpegDemuxer::getTimeBase(int streamIndex) const {
	AVStream* stream = getStream(streamIndex);
	if (!stream) {
		// 如果上下文无效或索引越界，返回一个无效的时间基
		return { 0, 1 };
	}
	return stream->time_base;
}

/**
* @brief获取媒体文件的总时长（单位：秒）
* 优先使用容器时长（AV_TIME_BASE 单位），不可用时退回到最长的流时长。
*/
double FFmpegDemuxer::getDuration() const {
	if (!pFormatCtx) {
		return 0.0;
	}
	if (pFormatCtx->duration != AV_NOPTS_VALUE && pFormatCtx->duration > 0) {
		return static_cast<double>(pFormatCtx->duration) / AV_TIME_BASE;
	}

	//例如对于某些直播流，容器没有确定的总时长
	double longest = 0.0;
	for (unsigned int i = 0; i < pFormatCtx->nb_streams; ++i) {
		const AVStream* stream = pFormatCtx->streams[i];
		if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
			double d = stream->duration * av_q2d(stream->time_base);
			if (d > longest) longest = d;
		}
	}
	return longest;
}

double FFmpegDemuxer::getStartTime() const {
	if (!pFormatCtx || pFormatCtx->start_time == AV_NOPTS_VALUE) {
		return 0.0;
	}
	return static_cast<double>(pFormatCtx->start_time) / AV_TIME_BASE;
}

int FFmpegDemuxer::readMemory(void* opaque, uint8_t* buf, int buf_size) {
	MemoryReader* reader = static_cast<MemoryReader*>(opaque);
	const int64_t total = static_cast<int64_t>(reader->buffer->size());
	const int64_t remaining = total - reader->position;
	if (remaining <= 0) {
		return AVERROR_EOF;
	}

	const int n = static_cast<int>(remaining < buf_size ? remaining : buf_size);
	memcpy(buf, reader->buffer->data() + reader->position, n);
	reader->position += n;
	return n;
}

int64_t FFmpegDemuxer::seekMemory(void* opaque, int64_t offset, int whence) {
	MemoryReader* reader = static_cast<MemoryReader*>(opaque);
	const int64_t total = static_cast<int64_t>(reader->buffer->size());

	switch (whence & ~AVSEEK_FORCE) {
	case AVSEEK_SIZE:
		return total;
	case SEEK_SET:
		break;
	case SEEK_CUR:
		offset += reader->position;
		break;
	case SEEK_END:
		offset += total;
		break;
	default:
		return AVERROR(EINVAL);
	}

	if (offset < 0 || offset > total) {
		return AVERROR(EINVAL);
	}
	reader->position = offset;
	return offset;
}
