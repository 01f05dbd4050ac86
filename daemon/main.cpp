/* Copyright (C) 2010-2025 by Arm Limited. All rights reserved. */

#include "AdbCamMain.h"

int main(int argc, char ** argv)
{
    return adbcam_main(argc, argv);
}
