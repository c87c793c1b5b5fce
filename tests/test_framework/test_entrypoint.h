// tests/test_framework/test_entrypoint.h
#pragma once

#include "tp_base.hpp"
#include <gtest/gtest.h>
/**
 * @file test_entrypoint.h
 * @brief Provides an API for registering worker scenario dispatchers.
 */

// Path of the running test executable, used by worker-spawning tests.
extern std::string g_self_exe_path;

/**
 * @brief Type definition for a worker scenario dispatcher function.
 *
 * A dispatcher takes the same arguments as `main()`, recognises its own
 * "module.scenario" names and runs the matching worker. It returns the worker's
 * exit code, or -1 when the scenario is not one of its own.
 */
using WorkerDispatchFn = int (*)(int argc, char **argv);

/**
 * @brief Registers a worker scenario dispatcher function with the test framework.
 *
 * Worker source files call this from a static initializer so that each test
 * executable only links the workers it uses.
 */
void register_worker_dispatcher(WorkerDispatchFn fn);
