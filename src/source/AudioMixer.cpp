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

#include "../include/AudioMixer.h"
#include <cmath>
#include <cstddef>

void AudioMixer::applyVolume(std::vector<float>& samples, double volume) {
	if (volume >= 1.0) {
		return;
	}
	const float gain = volume <= 0.0 ? 0.0f : static_cast<float>(volume);
	for (float& s : samples) {
		s *= gain;
	}
}

std::vector<float> AudioMixer::changeSpeed(const std::vector<float>& samples, int channels, double speed) {
	if (channels <= 0 || speed <= 0.0 || speed == 1.0) {
		return samples;
	}

	const size_t in_frames = samples.size() / channels;
	const size_t out_frames = static_cast<size_t>(std::floor(in_frames / speed));

	std::vector<float> out(out_frames * channels);
	for (size_t i = 0; i < out_frames; ++i) {
		size_t src = static_cast<size_t>(std::floor(i * speed));
		if (src >= in_frames) {
			src = in_frames - 1;
		}
		for (int c = 0; c < channels; ++c) {
			out[i * channels + c] = samples[src * channels + c];
		}
	}
	return out;
}
