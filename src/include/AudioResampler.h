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

#include <vector>

extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/frame.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
}

/**
 * @class AudioResampler
 * @brief 把任意格式的解码音频帧转换为输出设备需要的交错 float32 数据。
 *
 * 输入参数取自每一帧本身，参数变化（例如 Seek 后声道布局改变）时自动重建 SwrContext。
 */
class AudioResampler {
public:
	AudioResampler() = default;
	~AudioResampler();

	AudioResampler(const AudioResampler&) = delete;
	AudioResampler& operator=(const AudioResampler&) = delete;

	/**
	 * @brief 设置输出格式。
	 */
	void setOutput(int sampleRate, int channels);

	/**
	 * @brief 转换一帧。
	 * @param out 交错排列的 float 样本，大小为 返回值 * 输出声道数
	 * @return 输出的样本帧数，负值表示失败
	 */
	int convert(const AVFrame* frame, std::vector<float>& out);

	int outputSampleRate() const { return m_out_rate; }
	int outputChannels() const { return m_out_channels; }

	void close();

private:
	bool configure(const AVFrame* frame);

	SwrContext* m_swr_context = nullptr;
	int m_out_rate = 44100;
	int m_out_channels = 2;

	// 当前 SwrContext 对应的输入参数
	int m_in_rate = 0;
	int m_in_format = AV_SAMPLE_FMT_NONE;
	AVChannelLayout m_in_layout{};
};
