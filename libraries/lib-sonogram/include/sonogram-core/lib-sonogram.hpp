#pragma once

#ifndef lib_sonogram_hpp
#define lib_sonogram_hpp

#include "sonogram-core/util/util.hpp"
#include "sonogram-core/util/errors.hpp"
#include "sonogram-core/util/file-io.hpp"
#include "sonogram-core/util/logging.hpp"
#include "sonogram-core/util/image-buffer.hpp"
#include "sonogram-core/math/math-core.hpp"
#include "sonogram-core/queues/frame-channel.hpp"
#include "sonogram-core/analysis/sample-sink.hpp"
#include "sonogram-core/analysis/render-options.hpp"
#include "sonogram-core/analysis/spectral-analyzer.hpp"
#include "sonogram-core/analysis/waterfall-buffer.hpp"
#include "sonogram-core/playback/audio-pipeline.hpp"
#include "sonogram-core/playback/decode-pipeline.hpp"
#include "sonogram-core/playback/playback-controller.hpp"
#include "sonogram-core/playback/input-dispatcher.hpp"
#include "sonogram-core/config/command-line.hpp"
#include "sonogram-core/config/visualizer-config.hpp"

#endif // end lib_sonogram_hpp
