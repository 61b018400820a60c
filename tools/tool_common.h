/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_TOOL_COMMON_H
#define GRIDLINK_TOOL_COMMON_H

#include <stdint.h>
#include <stdio.h>
#include <atomic>
#include <istream>
#include <string>
#include <vector>

#include "gridlink_error.h"
#include "config/broker_config.h"

namespace gridlink {
namespace tools {

// Raised by SIGINT/SIGTERM; sessions poll it through their cancel_flag.
extern std::atomic<bool> g_cancel_requested;

void installSignalHandlers();

// Whole or fractional seconds, > 0, to milliseconds.
bool parseSeconds(const char* text, uint64_t& out_ms);

/**
 * @brief Load the broker settings and start logging.
 *
 * @param env_file    dotenv path; empty uses ".env" if it exists.
 * @param cli_level   --log-level value; empty keeps the configured one.
 */
bool setupRuntime(const std::string& env_file, const std::string& cli_level,
                  config::BrokerConfig& out);

// Process exit code for an operation result, logging the error.
int exitCodeFor(bool ok, const Error& error);

// The operator backing out of a prompt is a clean exit.
int exitCodeForOperatorCancel(const char* what);

/**
 * @brief Numbered device menu.
 *
 * Prints the candidates to out and reads answers from in until a valid
 * number is given. Invalid answers are reported and asked again.
 *
 * @return false when the operator types q or input ends.
 */
bool promptForDevice(const std::vector<std::string>& candidates, std::istream& in, FILE* out,
                     size_t& index);

// Waits for Enter. False on end of input or a pending SIGINT/SIGTERM.
bool promptForConfirmation(const std::string& question, std::istream& in, FILE* out);

}  // namespace tools
}  // namespace gridlink

#endif  // GRIDLINK_TOOL_COMMON_H
