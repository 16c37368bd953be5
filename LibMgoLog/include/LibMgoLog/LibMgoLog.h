#pragma once
/**
 * @file LibMgoLog.h
 * @brief Umbrella header for LibMgoLog. Include this to get the entire public API.
 */

#include "LibMgoLog/Core/Types.h"
#include "LibMgoLog/Core/Callbacks.h"
#include "LibMgoLog/Core/Config.h"
#include "LibMgoLog/Core/Sink.h"
#include "LibMgoLog/Core/CrashReporter.h"
#include "LibMgoLog/Core/LevelGate.h"
#include "LibMgoLog/Core/SinkRegistry.h"
#include "LibMgoLog/Core/Logging.h"
#include "LibMgoLog/Core/StandardFormatter.h"

// Worker crash diagnostics
#include "LibMgoLog/Core/Backtrace.h"
#include "LibMgoLog/Core/ScopedTask.h"

// Sinks
#include "LibMgoLog/Sinks/StreamSink.h"

// Crash reporting transport
#include "LibMgoLog/Report/MqttCrashReporter.h"
