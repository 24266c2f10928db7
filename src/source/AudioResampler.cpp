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

#include "../include/AudioResampler.h"
#include <iostream>

extern "C" {
#include <libavutil/opt.h>
#include <libavutil/error.h>
}

using namespace std;

AudioResampler::~AudioResampler() {
	close();
}

void AudioResampler::setOutput(int sampleRate, int channels) {
	if (sampleRate != m_out_rate || channels != m_out_channels) {
		close();
	}
	m_out_rate = sampleRate;
	m_out_channels = channels;
}

bool AudioResampler::configure(const AVFrame* frame) {
	// 参数未变化时复用现有的上下文
	if (m_swr_context && frame->sample_rate == m_in_rate && frame->format == m_in_format
		&& av_channel_layout_compare(&frame->ch_layout, &m_in_layout) == 0) {
		return true;
	}
	close();

	m_swr_context = swr_alloc();
	if (!m_swr_context) {
		cerr << "AudioResampler: Could not allocate resampler context." << endl;
		return false;
	}

	AVChannelLayout in_ch_layout, out_ch_layout;
	if (frame->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC || frame->ch_layout.nb_channels <= 0) {
		av_channel_layout_default(&in_ch_layout, frame->ch_layout.nb_channels > 0 ? frame->ch_layout.nb_channels : 1);
	}
	else if (av_channel_layout_copy(&in_ch_layout, &frame->ch_layout) < 0) {
		cerr << "AudioResampler: Could not copy input channel layout." << endl;
		close();
		return false;
	}
	av_channel_layout_default(&out_ch_layout, m_out_channels);

	av_opt_set_chlayout(m_swr_context, "in_chlayout", &in_ch_layout, 0);
	av_opt_set_int(m_swr_context, "in_sample_rate", frame->sample_rate, 0);
	av_opt_set_sample_fmt(m_swr_context, "in_sample_fmt", static_cast<AVSampleFormat>(frame->format), 0);

	av_opt_set_chlayout(m_swr_context, "out_chlayout", &out_ch_layout, 0);
	av_opt_set_int(m_swr_context, "out_sample_rate", m_out_rate, 0);
	av_opt_set_sample_fmt(m_swr_context, "out_sample_fmt", AV_SAMPLE_FMT_FLT, 0);

	int ret = swr_init(m_swr_context);
	av_channel_layout_uninit(&in_ch_layout);
	av_channel_layout_uninit(&out_ch_layout);
	if (ret < 0) {
		char errbuf[AV_ERROR_MAX_STRING_SIZE];
		av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, ret);
		cerr << "AudioResampler: Failed to initialize the resampling context: " << errbuf << endl;
		close();
		return false;
	}

	// 记录帧的原始参数，用于判断下一帧是否需要重建上下文
	m_in_rate = frame->sample_rate;
	m_in_format = frame->format;
	av_channel_layout_copy(&m_in_layout, &frame->ch_layout);

	cout << "AudioResampler: " << frame->sample_rate << " Hz, " << frame->ch_layout.nb_channels << " ch, "
		<< av_get_sample_fmt_name(static_cast<AVSampleFormat>(frame->format)) << " -> "
		<< m_out_rate << " Hz, " << m_out_channels << " ch, flt" << endl;
	return true;
}

int AudioResampler::convert(const AVFrame* frame, std::vector<float>& out) {
	out.clear();
	if (!frame || frame->nb_samples <= 0 || frame->sample_rate <= 0) {
		return 0;
	}
	if (!configure(frame)) {
		return AVERROR(EINVAL);
	}

	const int out_samples = swr_get_out_samples(m_swr_context, frame->nb_samples);
	if (out_samples < 0) {
		cerr << "AudioResampler: swr_get_out_samples() failed" << endl;
		return out_samples;
	}
	out.resize(static_cast<size_t>(out_samples) * m_out_channels);

	uint8_t* out_data[1] = { static_cast<uint8_t*>(static_cast<void*>(out.data())) };
	int converted_samples = swr_convert(m_swr_context, out_data, out_samples,
		const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
	if (converted_samples < 0) {
		cerr << "AudioResampler: Error while converting audio." << endl;
		out.clear();
		return converted_samples;
	}

	out.resize(static_cast<size_t>(converted_samples) * m_out_channels);
	return converted_samples;
}

void AudioResampler::close() {
	if (m_swr_context) {
		swr_free(&m_swr_context);
	}
	av_channel_layout_uninit(&m_in_layout);
	m_in_rate = 0;
	m_in_format = AV_SAMPLE_FMT_NONE;
}
