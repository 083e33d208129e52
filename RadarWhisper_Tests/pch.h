#pragma once

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <functional>
#include <algorithm>
#include <numeric>
#include <cmath>
#include <limits>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iostream>

#include "rw_errors.h"
#include "rw_track.h"
#include "rw_playlist.h"
#include "rw_sequencer.h"
#include "rw_playlist_codec.h"
#include "rw_playlist_manager.h"
#include "rw_playback_engine.h"
#include "rw_player.h"
#include "rw_settings.h"
#include "rw_utils.h"
#include "rw_test_helpers.h"
