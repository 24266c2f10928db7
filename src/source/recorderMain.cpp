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

#include <iostream>
#include <string>
#include <stdexcept>
#include <cstdlib>
#include <algorithm>

#include "../include/VideoRecorder.h"
#include "../include/SurfaceUtils.h"

extern "C" {
#include <libavutil/log.h>
}

using namespace std;

// 画一帧测试图案：渐变背景加一个水平移动的方块
void draw_test_pattern(SDL_Surface* surface, int frame_index, int fps) {
    const Uint8 shade = static_cast<Uint8>((frame_index * 4) % 256);
    SDL_FillRect(surface, nullptr, SDL_MapRGB(surface->format, shade, 32, 255 - shade));

    const int box = surface->h / 4;
    const int travel = surface->w - box;
    const int period = fps * 2;     // 两秒走完一个来回
    const int phase = frame_index % period;
    const int x = travel * (phase < period / 2 ? phase : period - phase) / (period / 2);
    SDL_Rect rect{ x, (surface->h - box) / 2, box, box };
    SDL_FillRect(surface, &rect, SDL_MapRGB(surface->format, 255, 255, 255));
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cerr << "Usage: " << argv[0] << " <output_file> [seconds] [--audio]" << endl;
        return 1;
    }

    RecorderConfig config;
    config.outputFile = argv[1];
    config.width = 640;
    config.height = 360;
    config.frameRate = 30;
    int seconds = 5;
    for (int i = 2; i < argc; ++i) {
        const string arg = argv[i];
        if (arg == "--audio") {
            config.recordAudio = true;
        }
        else {
            seconds = std::max(1, atoi(arg.c_str()));
        }
    }

    if (SDL_Init(SDL_INIT_AUDIO | SDL_INIT_TIMER) < 0) {
        cerr << "FATAL: SDL could not initialize! SDL_Error: " << SDL_GetError() << endl;
        return 1;
    }
    av_log_set_level(AV_LOG_ERROR);
    cout << "Application: Recording " << seconds << " s to " << config.outputFile << endl;

    int exit_code = 0;
    try {
        VideoRecorder recorder(config);
        SurfacePtr canvas = createSurface(config.width, config.height);
        if (!canvas) {
            throw std::runtime_error("Could not create the drawing surface.");
        }

        recorder.start();
        const Uint32 frame_ms = 1000 / config.frameRate;
        const int total_frames = seconds * config.frameRate;
        const Uint32 begin = SDL_GetTicks();
        for (int i = 0; i < total_frames && !recorder.isStopped(); ++i) {
            draw_test_pattern(canvas.get(), i, config.frameRate);
            recorder.writeFrame(canvas.get());

            const Uint32 due = begin + static_cast<Uint32>(i + 1) * frame_ms;
            const Uint32 now = SDL_GetTicks();
            if (due > now) {
                SDL_Delay(due - now);
            }
        }
        recorder.stop();

        cout << "Application: " << recorder.framesEncoded() << " frames encoded, "
            << recorder.framesDropped() << " dropped." << endl;
        if (!recorder.lastError().empty()) {
            cerr << "Application: Recording finished with error: " << recorder.lastError() << endl;
            exit_code = 1;
        }
    }
    catch (const SourceError& e) {
        cerr << "Source Error: " << e.what() << endl;
        exit_code = 1;
    }
    catch (const DeviceError& e) {
        cerr << "Device Error: " << e.what() << endl;
        exit_code = 1;
    }
    catch (const std::runtime_error& e) {
        cerr << "Runtime Error: " << e.what() << endl;
        exit_code = 1;
    }

    SDL_Quit();
    return exit_code;
}
