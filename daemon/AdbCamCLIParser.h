/* Copyright (C) 2014-2025 by Arm Limited. All rights reserved. */

#ifndef ADBCAMCLIPARSER_H_
#define ADBCAMCLIPARSER_H_

#include "ParserResult.h"

/**
 * This class is responsible for parsing all the command line arguments
 * passed to adbcamd.
 */
class AdbCamCLIParser {
public:
    static const char * const USAGE_MESSAGE;

    ParserResult result {};

    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    static bool hasDebugFlag(int argc, const char * const argv[]);

    //NOLINTNEXTLINE(modernize-avoid-c-arrays)
    void parseCLIArguments(int argc, char * argv[]);
};

#endif /* ADBCAMCLIPARSER_H_ */
