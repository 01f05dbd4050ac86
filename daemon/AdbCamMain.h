/* Copyright (C) 2010-2025 by Arm Limited. All rights reserved. */

#pragma once

/**
 * The adbcamd entry point: parse the command line, prepare the host devices, then supervise the capture
 * processes until the device disconnects, they exit, or the operator interrupts.
 *
 * @return the process exit status
 */
int adbcam_main(int argc, char ** argv);
