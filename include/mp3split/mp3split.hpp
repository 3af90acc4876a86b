#pragma once

#include "mp3split/audio_io.hpp"
#include "mp3split/config.hpp"
#include "mp3split/errors.hpp"
#include "mp3split/partition.hpp"
#include "mp3split/split.hpp"
#include "mp3split/wav.hpp"
