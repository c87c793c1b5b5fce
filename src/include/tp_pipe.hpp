#pragma once
/**
 * @file tp_pipe.hpp
 * @brief Layer 3: The testpipe producer/consumer pipeline built on tp_service.
 *
 * Engine side: Emitter and the engine object model. Front-end side: ChildProcess,
 * StreamReconstructor, Dispatcher, TestState, ProgressMapper and RunController.
 */
#include "tp_service.hpp"

#include "pipe/errors.hpp"
#include "pipe/node_id.hpp"
#include "pipe/representation.hpp"
#include "pipe/value.hpp"
#include "pipe/engine_types.hpp"
#include "pipe/codec.hpp"
#include "pipe/message.hpp"
#include "pipe/line_assembler.hpp"

#include "pipe/emitter.hpp"

#include "pipe/child_process.hpp"
#include "pipe/stream_reconstructor.hpp"
#include "pipe/dispatcher.hpp"
#include "pipe/time_stats.hpp"
#include "pipe/test_state.hpp"
#include "pipe/progress_grouping.hpp"
#include "pipe/run_context.hpp"
#include "pipe/buffered_writer.hpp"
#include "pipe/run_controller.hpp"
