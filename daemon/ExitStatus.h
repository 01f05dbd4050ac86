/* Copyright (C) 2010-2025 by Arm Limited. All rights reserved. */

#ifndef EXITSTATUS_H_
#define EXITSTATUS_H_

static constexpr int EXCEPTION_EXIT_CODE = 1;
/// the command line could not be parsed
static constexpr int PARSE_FAILED_EXIT_CODE = 2;
/// a setup step (device, loopback module, audio bridge, selection) did not complete
static constexpr int PRECONDITION_FAILED_EXIT_CODE = 3;
/// one of the capture processes could not be started
static constexpr int LAUNCH_FAILED_EXIT_CODE = 4;
/// a one-shot host command (e.g. camera listing) failed
static constexpr int COMMAND_FAILED_EXIT_CODE = 8;

#endif /* EXITSTATUS_H_ */
