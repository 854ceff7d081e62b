#pragma once

// podkit umbrella header

#include "podkit/types.hpp"
#include "podkit/error.hpp"
#include "podkit/config.hpp"
#include "podkit/align.hpp"
#include "podkit/pod.hpp"
#include "podkit/leb128.hpp"
#include "podkit/offset_set.hpp"
#include "podkit/string_table.hpp"
#include "podkit/sink.hpp"
#include "podkit/writer.hpp"
#include "podkit/log/logger.hpp"
